/*
 * Copyright (C) 2026 The LiftLens authors
 *
 * This file is part of LiftLens.
 *
 * LiftLens is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LiftLens is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LiftLens.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/property_tree/xml_parser.hpp>

#include "api/SkeletonVideoResource.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/IDb.hpp"

namespace liftlens
{
    namespace
    {
        constexpr std::string_view skeletonVideoPath{ "/api/analyses/${id}/skeleton-video" };

        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            // Streams are served one chunk at a time, reading files is blocking
            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        void writeWtConfig(const std::filesystem::path& wtConfigPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            boost::property_tree::ptree pt;
            pt.put("server.application-settings.<xmlattr>.location", "*");

            if (config.getBool("behind-reverse-proxy", false))
            {
                pt.put("server.application-settings.trusted-proxy-config.original-ip-header", std::string{ config.getString("original-ip-header", "X-Forwarded-For") });
                config.visitStrings(
                    "trusted-proxies", [&](std::string_view trustedProxy) {
                        pt.add("server.application-settings.trusted-proxy-config.trusted-proxies.proxy", std::string{ trustedProxy });
                    },
                    { "127.0.0.1", "::1" });
            }

            std::ofstream ofs{ wtConfigPath, std::ios::out | std::ios::trunc };
            if (!ofs)
                throw core::LiftLensException{ "Cannot open '" + wtConfigPath.string() + "' for writing" };

            boost::property_tree::xml_parser::write_xml(ofs, pt);
            ofs.flush();
            if (!ofs)
                throw core::LiftLensException{ "Cannot write '" + wtConfigPath.string() + "'" };
        }

        // Wt only takes its settings from the command line and from its own config file
        std::vector<std::string> buildWtServerArgs(std::string_view execPath, const std::filesystem::path& wtConfigPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            return {
                std::string{ execPath },
                "--config=" + wtConfigPath.string(),
                "--docroot=" + std::string{ config.getString("docroot", "/usr/share/liftlens/docroot") },
                "--http-address=" + std::string{ config.getString("listen-addr", "0.0.0.0") },
                "--http-port=" + std::to_string(config.getULong("listen-port", 8080)),
                "--threads=" + std::to_string(getThreadCount()),
            };
        }

        core::logging::Severity getLogMinSeverity()
        {
            const std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(minSeverity) })
                return *severity;

            throw core::LiftLensException{ "Invalid config value for 'log-min-severity': '" + std::string{ minSeverity } + "'" };
        }

        // Forwards Wt's own logs to the LiftLens logger
        class WtLogSink : public Wt::WLogSink
        {
        public:
            WtLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                const core::logging::Severity severity{ getSeverity(type, scope) };
                if (_logger.isSeverityActive(severity))
                    _logger.processLog(core::logging::Module::WT, severity, message);
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                return _logger.isSeverityActive(getSeverity(type, scope));
            }

            static core::logging::Severity getSeverity(std::string_view type, std::string_view scope)
            {
                const core::logging::Severity severity{ core::logging::parseSeverity(type).value_or(core::logging::Severity::INFO) };

                // one line per served chunk otherwise
                if (severity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return severity;
            }

            core::logging::ILogger& _logger;
        };
    } // namespace

    int main(int argc, char* argv[])
    {
        const std::string_view execPath{ argc > 0 ? argv[0] : "liftlens" };
        std::filesystem::path configFilePath{ "/etc/liftlens.conf" };

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << execPath << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the LiftLens configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }
        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = arg;
        }

        try
        {
            close(STDIN_FILENO);

            // peer disconnects must show up as write errors
            std::signal(SIGPIPE, SIG_IGN);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/liftlens") };
            std::filesystem::create_directories(workingDir);

            const std::filesystem::path wtConfigPath{ workingDir / "wt_config.xml" };
            writeWtConfig(wtConfigPath);

            const std::vector<std::string> wtServerArgs{ buildWtServerArgs(execPath, wtConfigPath) };
            std::vector<char*> wtArgv;
            for (const std::string& arg : wtServerArgs)
            {
                LIFTLENS_LOG(MAIN, DEBUG, "Wt arg: " << arg);
                wtArgv.push_back(const_cast<char*>(arg.c_str()));
            }

            WtLogSink wtLogSink{ *logger };
            Wt::WServer server{ std::string{ execPath } };
            server.setCustomLogger(wtLogSink);
            server.setServerConfiguration(static_cast<int>(wtArgv.size()), wtArgv.data());

            // one connection per HTTP thread by default
            std::unique_ptr<db::IDb> database{ db::createDb(config->getPath("db-path", "/var/liftlens/liftlens.db"), config->getULong("db-connection-count", getThreadCount())) };

            std::unique_ptr<Wt::WResource> skeletonVideoResource{ api::createSkeletonVideoResource(*database) };
            server.addResource(skeletonVideoResource.get(), std::string{ skeletonVideoPath });

            LIFTLENS_LOG(MAIN, INFO, "Starting server, serving skeleton videos on '" << skeletonVideoPath << "'");
            server.start();

            Wt::WServer::waitForShutdown();

            LIFTLENS_LOG(MAIN, INFO, "Stopping server...");
            server.stop();
            LIFTLENS_LOG(MAIN, INFO, "Server stopped");
        }
        catch (const Wt::WServer::Exception& e)
        {
            std::cerr << "Server error: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Fatal error: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
} // namespace liftlens

int main(int argc, char* argv[])
{
    return liftlens::main(argc, argv);
}
