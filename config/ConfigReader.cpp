#include "ConfigReader.h"
#include "logger/Logger.h"
#include <cstdio>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

namespace config
{

bool ConfigReader::readFromFile(const std::string& fileName)
{
    logger::info("Reading config file %s", "ConfigReader", fileName.c_str());
    std::unique_ptr<FILE, int (*)(FILE*)> configFile(fopen(fileName.c_str(), "r"), &fclose);
    if (!configFile)
    {
        logger::warn("Failed reading config file %s, unable to open file", "ConfigReader", fileName.c_str());
        return false;
    }

    fseek(configFile.get(), 0, SEEK_END);
    const auto fileLength = ftell(configFile.get());
    fseek(configFile.get(), 0, SEEK_SET);
    if (fileLength < 0)
    {
        logger::warn("Failed reading config file %s, unable to determine size", "ConfigReader", fileName.c_str());
        return false;
    }

    std::vector<char> fileBuffer(fileLength + 1, '\0');
    const auto bytesRead = fread(fileBuffer.data(), 1, fileLength, configFile.get());
    if (bytesRead != static_cast<size_t>(fileLength))
    {
        logger::warn("Failed reading config file %s, short read", "ConfigReader", fileName.c_str());
        return false;
    }

    return parse(fileBuffer.data());
}

bool ConfigReader::readFromString(const std::string& json)
{
    return parse(json.c_str());
}

bool ConfigReader::parse(const char* buffer)
{
    bool result = true;
    try
    {
        nlohmann::json parsedConfig = nlohmann::json::parse(buffer);

        for (auto property : _properties)
        {
            if (!property->read(parsedConfig))
            {
                logger::error("Config param is missing %s", "ConfigReader", property->getName().c_str());
                result = false;
            }
        }
    }
    catch (const std::exception& e)
    {
        logger::warn("Failed reading config: %s", "ConfigReader", e.what());
        return false;
    }

    return result;
}

} // namespace config
