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

#include "Config.hpp"

#include <string>

#include "core/Exception.hpp"

namespace liftlens::core
{
    namespace
    {
        // missing settings and settings of an unexpected type give def
        template<typename T>
        T lookupOr(const libconfig::Config& config, std::string_view setting, T def)
        {
            try
            {
                return static_cast<T>(config.lookup(std::string{ setting }));
            }
            catch (const libconfig::ConfigException&)
            {
                return def;
            }
        }
    } // namespace

    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw LiftLensException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw LiftLensException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw LiftLensException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const char* res{ lookupOr<const char*>(_config, setting, nullptr) };
        return res ? std::string_view{ res } : def;
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs)
    {
        if (!_config.exists(std::string{ setting }))
        {
            for (std::string_view def : defs)
                func(def);
            return;
        }

        try
        {
            const libconfig::Setting& values{ _config.lookup(std::string{ setting }) };
            for (int i{}; i < values.getLength(); ++i)
                func(static_cast<const char*>(values[i]));
        }
        catch (const libconfig::ConfigException&)
        {
            throw LiftLensException{ "Invalid value for setting '" + std::string{ setting } + "': expected a list of strings" };
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const char* res{ lookupOr<const char*>(_config, setting, nullptr) };
        return res ? std::filesystem::path{ res } : def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        return lookupOr<unsigned long>(_config, setting, def);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookupOr<bool>(_config, setting, def);
    }
} // namespace liftlens::core
