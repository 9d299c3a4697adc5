#ifndef QB_MODULE_SWAGGER_LOGGER_H_
#define QB_MODULE_SWAGGER_LOGGER_H_

#include <qb/io.h> // This should include nanolog.h if QB_LOGGER is defined

// Define a common prefix for all qbm-swagger logs to easily identify them.
#define QBM_SWAGGER_LOG_PREFIX "[qbm-swagger] "

#ifdef QB_LOGGER

#define LOG_SWAGGER_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_SWAGGER_LOG_PREFIX << "TRACE: " << X)

#define LOG_SWAGGER_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_SWAGGER_LOG_PREFIX << "DEBUG: " << X)

#define LOG_SWAGGER_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << QBM_SWAGGER_LOG_PREFIX << "INFO: " << X)

#define LOG_SWAGGER_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << QBM_SWAGGER_LOG_PREFIX << "WARN: " << X)

#define LOG_SWAGGER_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_SWAGGER_LOG_PREFIX << "ERROR: " << X) // Map ERROR to CRIT for higher visibility

#else // QB_LOGGER not defined, fallback to QB_STDOUT_LOG or no-op

#ifdef QB_STDOUT_LOG
#define LOG_SWAGGER_TRACE(X) qb::io::cout() << QBM_SWAGGER_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_SWAGGER_DEBUG(X) qb::io::cout() << QBM_SWAGGER_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_SWAGGER_INFO(X)  qb::io::cout() << QBM_SWAGGER_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_SWAGGER_WARN(X)  qb::io::cout() << QBM_SWAGGER_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_SWAGGER_ERROR(X) qb::io::cerr() << QBM_SWAGGER_LOG_PREFIX << "ERROR: " << X << std::endl

#else // QB_STDOUT_LOG not defined, logs are no-ops

#define LOG_SWAGGER_TRACE(X) do {} while (false)
#define LOG_SWAGGER_DEBUG(X) do {} while (false)
#define LOG_SWAGGER_INFO(X)  do {} while (false)
#define LOG_SWAGGER_WARN(X)  do {} while (false)
#define LOG_SWAGGER_ERROR(X) do {} while (false)

#endif // QB_STDOUT_LOG
#endif // QB_LOGGER

#endif // QB_MODULE_SWAGGER_LOGGER_H_
