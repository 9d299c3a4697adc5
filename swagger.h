/**
 * @file qbm/swagger/swagger.h
 * @brief Main interface of the qb swagger module
 *
 * Schema-driven request and response contracts for interceptor-chain
 * routing, and generation of the API document from the same contracts:
 *
 * - Schema coercion and validation with human-readable error trees
 * - Contracts attached to handlers and interceptors
 * - Route groups expanded into a flat route table
 * - Request coercion, response validation and body parsing interceptors
 * - Aggregate document compilation and Swagger 2.0 serialization
 *
 * @code
 * #include <qbm/swagger/swagger.h>
 *
 * using namespace qb::swagger;
 *
 * RouteGroup root("/");
 * root.use(body_params())
 *     .use(coerce_request())
 *     .use(validate_response())
 *     .get(handler("hello", openapi::Contract::from_json({{"summary", "Greets"}}),
 *                  [](const Request &) { return Response(200, "hello"); }))
 *     .group(RouteGroup("/doc").get(swagger_json()));
 *
 * Router router(openapi::inject_docs(openapi::ApiInfo().setTitle("Hello"), root.expand()));
 * Response response = router.route(Request(Method::GET, "/doc"));
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#ifndef QB_MODULE_SWAGGER_H_
#define QB_MODULE_SWAGGER_H_
#include "./types.h"
#include "./request.h"
#include "./response.h"
#include "./options.h"
#include "./validation/error.h"
#include "./validation/explain.h"
#include "./validation/rule.h"
#include "./validation/coercer.h"
#include "./validation/adapter.h"
#include "./openapi/contract.h"
#include "./openapi/annotation.h"
#include "./openapi/document.h"
#include "./openapi/compiler.h"
#include "./openapi/swagger.h"
#include "./routing/context.h"
#include "./routing/interceptor.h"
#include "./routing/route.h"
#include "./routing/route_group.h"
#include "./routing/chain.h"
#include "./routing/router.h"
#include "./middleware/body_params.h"
#include "./middleware/coerce_request.h"
#include "./middleware/validate_response.h"
#include "./middleware/swagger_json.h"
#include "./middleware/builders.h"
#endif // QB_MODULE_SWAGGER_H_
