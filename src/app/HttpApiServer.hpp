/**
 * @file HttpApiServer.hpp
 * @brief JSON-over-HTTP adapter around the application services.
 */

#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "application/AppServices.hpp"

namespace httplib {
class Server;
}

namespace lextable::app {

/**
 * @class HttpApiServer
 * @brief Routes:
 *   GET   /health
 *   GET   /documents
 *   POST  /runs                {mode, wait, template_path?}
 *   GET   /runs/{id}
 *   GET   /results/table?job_id=
 *   GET   /cells/{id}
 *   PATCH /cells/{id}          {review_state?, manual_value?, reason?, actor, version}
 *   GET   /cells/{id}/audit
 *   POST  /exports/csv         {job_id?}
 */
class HttpApiServer {
public:
    explicit HttpApiServer(application::AppServices& services);
    ~HttpApiServer();

    /** @brief Blocks serving until stop() is called. @return false if the socket could not be bound. */
    bool listen(const std::string& host, int port);
    void stop();

    static nlohmann::json ResultToJson(const application::ResultTable& table);

    /** @throws ValidationError for a malformed body. */
    static domain::review::ReviewAction ParseReviewAction(const nlohmann::json& body);

    /** @brief HTTP status for an engine error. */
    static int StatusFor(const std::exception& e);

private:
    void registerRoutes();
    std::string resolveJobId(const std::string& requested);

    application::AppServices& m_services;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace lextable::app
