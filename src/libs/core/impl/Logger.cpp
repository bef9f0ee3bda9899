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

#include "Logger.hpp"

#include <array>
#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace liftlens::core::logging
{
    namespace
    {
        constexpr std::array<std::pair<Severity, const char*>, 5> severityNames{ {
            { Severity::FATAL, "fatal" },
            { Severity::ERROR, "error" },
            { Severity::WARNING, "warning" },
            { Severity::INFO, "info" },
            { Severity::DEBUG, "debug" },
        } };
    } // namespace

    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::API:
            return "API";
        case Module::DB:
            return "DB";
        case Module::MAIN:
            return "MAIN";
        case Module::STREAMING:
            return "STREAMING";
        case Module::UTILS:
            return "UTILS";
        case Module::WT:
            return "WT";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        for (const auto& [severity, name] : severityNames)
        {
            if (severity == sev)
                return name;
        }
        return "";
    }

    std::optional<Severity> parseSeverity(std::string_view str)
    {
        for (const auto& [severity, name] : severityNames)
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, name))
                return severity;
        }
        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (logFilePath.empty())
            return;

        _logFile.open(logFilePath, std::ios::out | std::ios::app);
        if (!_logFile.is_open())
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw LiftLensException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
        }
    }

    Logger::~Logger() = default;

    bool Logger::isSeverityActive(Severity severity) const
    {
        // enumerators are sorted from the most to the least severe
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const std::string timestamp{ stringUtils::toISO8601String(Wt::WDateTime::currentDateTime()) };

        const std::scoped_lock lock{ _mutex };
        getOutputStream(severity) << timestamp << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }

    std::ostream& Logger::getOutputStream(Severity severity)
    {
        if (_logFile.is_open())
            return _logFile;

        return (severity == Severity::DEBUG || severity == Severity::INFO) ? std::cout : std::cerr;
    }
} // namespace liftlens::core::logging
