/**
 * @file LexTableApp.cpp
 * @brief Implementation of LexTableApp.
 */

#include "app/LexTableApp.hpp"

#include <iostream>

#include "app/HttpApiServer.hpp"
#include "application/ExportService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSystemDocumentSource.hpp"
#include "infrastructure/FsCellRepository.hpp"
#include "infrastructure/TemplateStore.hpp"

namespace lextable::app {

void LexTableApp::PrintUsage() {
    std::cerr << "Usage: lextable [--config settings.json] <command>\n"
              << "  validate-template [path]\n"
              << "  run --mode quick|full [--template path] [--csv]\n"
              << "  serve\n";
}

void LexTableApp::Init(const std::string& configPath) {
    m_services.config = infrastructure::ConfigLoader::Load(configPath);
    const auto& config = m_services.config;

    // Dependency Injection / Composition Root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.repository = std::make_shared<infrastructure::FsCellRepository>(
        config.storeDir, m_services.persistenceService);
    m_services.documentSource = std::make_shared<infrastructure::FileSystemDocumentSource>(
        std::vector<std::string>{config.dataDir, config.uploadsDir});
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();
    m_services.orchestrator = std::make_unique<application::JobOrchestrator>(
        m_services.documentSource, m_services.repository, m_services.taskManager, config);
    m_services.reviewService = std::make_unique<application::ReviewService>(m_services.repository);
}

void LexTableApp::Shutdown() {
    m_services.reviewService.reset();
    m_services.orchestrator.reset();
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
    }
}

int LexTableApp::Run(const std::vector<std::string>& args) {
    std::string configPath = "settings.json";
    std::vector<std::string> rest;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                PrintUsage();
                return 2;
            }
            configPath = args[++i];
        } else {
            rest.push_back(args[i]);
        }
    }

    if (rest.empty()) {
        PrintUsage();
        return 2;
    }

    const std::string command = rest.front();
    rest.erase(rest.begin());

    if (command == "validate-template") {
        // No services needed.
        m_services.config = infrastructure::ConfigLoader::Load(configPath);
        return ValidateTemplate(rest);
    }
    if (command != "run" && command != "serve") {
        std::cerr << "Unknown command: " << command << "\n";
        PrintUsage();
        return 2;
    }

    Init(configPath);
    int code = command == "run" ? RunJob(rest) : Serve();
    Shutdown();
    return code;
}

int LexTableApp::ValidateTemplate(const std::vector<std::string>& args) {
    const std::string path = args.empty() ? m_services.config.templatePath : args.front();
    try {
        auto store = infrastructure::TemplateStore::Load(path);
        std::cout << "Template '" << store->templateId() << "' is valid: "
                  << store->fields().size() << " fields" << std::endl;
        return 0;
    } catch (const domain::TemplateError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

int LexTableApp::RunJob(const std::vector<std::string>& args) {
    domain::JobMode mode = domain::JobMode::Quick;
    std::optional<std::string> templatePath;
    bool writeCsv = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--mode" && i + 1 < args.size()) {
            auto parsed = domain::JobModeFromString(args[++i]);
            if (!parsed) {
                std::cerr << "--mode must be 'quick' or 'full'" << std::endl;
                return 2;
            }
            mode = *parsed;
        } else if (args[i] == "--template" && i + 1 < args.size()) {
            templatePath = args[++i];
        } else if (args[i] == "--csv") {
            writeCsv = true;
        } else {
            std::cerr << "Unexpected argument: " << args[i] << std::endl;
            PrintUsage();
            return 2;
        }
    }

    domain::Job job = m_services.orchestrator->run(mode, templatePath);
    if (job.status != domain::JobStatus::Succeeded) {
        std::cerr << "Job " << job.id << " failed: " << job.errorMessage.value_or("unknown error") << std::endl;
        return 1;
    }

    auto table = m_services.orchestrator->result(job.id);
    std::cout << HttpApiServer::ResultToJson(table).dump(2) << std::endl;

    if (writeCsv) {
        try {
            application::ExportService::writeCsv(table, m_services.config.exportsDir);
        } catch (const std::exception& e) {
            std::cerr << "CSV export failed: " << e.what() << std::endl;
            return 1;
        }
    }
    return 0;
}

int LexTableApp::Serve() {
    HttpApiServer server(m_services);
    if (!server.listen(m_services.config.host, m_services.config.port)) {
        std::cerr << "[HttpApi] Could not bind " << m_services.config.host << ":"
                  << m_services.config.port << std::endl;
        return 1;
    }
    return 0;
}

} // namespace lextable::app
