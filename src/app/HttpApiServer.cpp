/**
 * @file HttpApiServer.cpp
 * @brief Implementation of HttpApiServer.
 */

#include "app/HttpApiServer.hpp"

#include <httplib.h>
#include <iostream>

#include "application/ExportService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/TemplateStore.hpp"

namespace lextable::app {

using json = nlohmann::json;
using namespace lextable::domain;
using namespace lextable::domain::review;

namespace {

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Runs a handler and maps engine errors onto HTTP statuses.
template <typename F>
void Guarded(httplib::Response& res, F&& handler) {
    try {
        handler();
    } catch (const json::exception& e) {
        SendJson(res, {{"error", std::string("invalid JSON: ") + e.what()}}, 400);
    } catch (const std::exception& e) {
        const int status = HttpApiServer::StatusFor(e);
        if (status >= 500) {
            std::cerr << "[HttpApi] " << e.what() << std::endl;
        }
        SendJson(res, {{"error", e.what()}}, status);
    }
}

json ParseBody(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body);
    if (!body.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }
    return body;
}

} // namespace

HttpApiServer::HttpApiServer(application::AppServices& services)
    : m_services(services), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpApiServer::~HttpApiServer() = default;

int HttpApiServer::StatusFor(const std::exception& e) {
    if (dynamic_cast<const ValidationError*>(&e)) return 400;
    if (dynamic_cast<const NotFoundError*>(&e)) return 404;
    if (dynamic_cast<const ConcurrencyError*>(&e)) return 409;
    if (dynamic_cast<const TemplateError*>(&e)) return 422;
    return 500;
}

ReviewAction HttpApiServer::ParseReviewAction(const json& body) {
    ReviewAction action;
    if (body.contains("review_state") && !body["review_state"].is_null()) {
        if (!body["review_state"].is_string()) throw ValidationError("review_state must be a string");
        const auto name = body["review_state"].get<std::string>();
        action.reviewState = ReviewStateFromString(name);
        if (!action.reviewState) throw ValidationError("unknown review_state '" + name + "'");
    }
    if (body.contains("manual_value") && !body["manual_value"].is_null()) {
        if (!body["manual_value"].is_string()) throw ValidationError("manual_value must be a string");
        action.manualValue = body["manual_value"].get<std::string>();
    }
    if (body.contains("reason") && !body["reason"].is_null()) {
        if (!body["reason"].is_string()) throw ValidationError("reason must be a string");
        action.reason = body["reason"].get<std::string>();
    }
    if (body.contains("actor")) {
        if (!body["actor"].is_string()) throw ValidationError("actor must be a string");
        action.actor = body["actor"].get<std::string>();
    }
    if (body.contains("version")) {
        if (!body["version"].is_number_integer()) throw ValidationError("version must be an integer");
        action.expectedVersion = body["version"].get<int>();
    }
    action.validate();
    return action;
}

json HttpApiServer::ResultToJson(const application::ResultTable& table) {
    json documents = json::array();
    for (const auto& doc : table.documents) {
        documents.push_back({{"id", doc.id}, {"identifier", doc.identifier}});
    }
    json fields = json::array();
    for (const auto& field : table.fields) {
        fields.push_back({{"key", field.key}, {"label", field.label}, {"type", FieldTypeToString(field.type)}});
    }
    json rows = json::array();
    for (const auto& row : table.rows) {
        json cells = json::array();
        for (const auto& cell : row.cells) {
            cells.push_back(infrastructure::CellToJson(cell));
        }
        rows.push_back({
            {"field_key", row.fieldKey},
            {"field_label", row.fieldLabel},
            {"field_type", FieldTypeToString(row.fieldType)},
            {"cells", cells}
        });
    }
    return {
        {"job", infrastructure::JobToJson(table.job)},
        {"documents", documents},
        {"fields", fields},
        {"rows", rows}
    };
}

std::string HttpApiServer::resolveJobId(const std::string& requested) {
    if (!requested.empty()) return requested;
    auto latest = m_services.orchestrator->latestSucceededJobId();
    if (!latest) {
        throw NotFoundError("no succeeded job");
    }
    return *latest;
}

void HttpApiServer::registerRoutes() {
    auto& svr = *m_server;

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, {{"status", "ok"}});
    });

    svr.Get("/documents", [this](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] {
            json docs = json::array();
            for (const auto& doc : m_services.documentSource->listDocuments()) {
                docs.push_back({
                    {"id", doc.id},
                    {"identifier", doc.identifier},
                    {"format", DocumentFormatToString(doc.format)},
                    {"size_bytes", doc.rawBytes.size()}
                });
            }
            SendJson(res, {{"documents", docs}});
        });
    });

    svr.Post("/runs", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            const std::string modeName = body.value("mode", std::string("quick"));
            auto mode = JobModeFromString(modeName);
            if (!mode) throw ValidationError("mode must be 'quick' or 'full'");

            std::optional<std::string> templatePath;
            if (body.contains("template_path") && body["template_path"].is_string()) {
                templatePath = body["template_path"].get<std::string>();
            }
            // Reject a broken template before a job is created for it.
            infrastructure::TemplateStore::Load(templatePath.value_or(m_services.config.templatePath));

            const std::string jobId = m_services.orchestrator->submit(*mode, templatePath);
            if (body.value("wait", false)) {
                SendJson(res, infrastructure::JobToJson(m_services.orchestrator->wait(jobId)));
            } else {
                auto job = m_services.orchestrator->job(jobId);
                if (!job) throw NotFoundError("job " + jobId);
                SendJson(res, infrastructure::JobToJson(*job), 202);
            }
        });
    });

    svr.Get(R"(/runs/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            const std::string jobId = req.matches[1];
            auto job = m_services.orchestrator->job(jobId);
            if (!job) throw NotFoundError("job " + jobId);
            SendJson(res, infrastructure::JobToJson(*job));
        });
    });

    svr.Get("/results/table", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            const std::string jobId = resolveJobId(req.get_param_value("job_id"));
            SendJson(res, ResultToJson(m_services.orchestrator->result(jobId)));
        });
    });

    svr.Get(R"(/cells/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            SendJson(res, infrastructure::CellToJson(m_services.reviewService->cell(req.matches[1])));
        });
    });

    svr.Patch(R"(/cells/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            const ReviewAction action = ParseReviewAction(ParseBody(req));
            SendJson(res, infrastructure::CellToJson(m_services.reviewService->review(req.matches[1], action)));
        });
    });

    svr.Get(R"(/cells/([0-9a-f]+)/audit)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json entries = json::array();
            for (const auto& entry : m_services.reviewService->auditLog(req.matches[1])) {
                entries.push_back(infrastructure::AuditEntryToJson(entry));
            }
            SendJson(res, {{"cell_id", std::string(req.matches[1])}, {"entries", entries}});
        });
    });

    svr.Post("/exports/csv", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            const std::string jobId = resolveJobId(body.value("job_id", std::string()));
            const auto table = m_services.orchestrator->result(jobId);
            const std::string path = application::ExportService::writeCsv(table, m_services.config.exportsDir);
            SendJson(res, {{"job_id", jobId}, {"path", path}});
        });
    });
}

bool HttpApiServer::listen(const std::string& host, int port) {
    std::cout << "[HttpApi] Listening on http://" << host << ":" << port << std::endl;
    return m_server->listen(host.c_str(), port);
}

void HttpApiServer::stop() {
    m_server->stop();
}

} // namespace lextable::app
