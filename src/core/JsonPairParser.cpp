#include "JsonPairParser.h"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace core
{
    namespace
    {
        Position parsePosition(const json &item, const char *field, size_t index)
        {
            if (!item.contains(field) || !item[field].is_object())
            {
                throw std::runtime_error("Pair " + std::to_string(index) + " does not contain an '" + field + "' object");
            }
            const auto &p = item[field];
            if (!p.contains("latitude") || !p["latitude"].is_number() ||
                !p.contains("longitude") || !p["longitude"].is_number())
            {
                throw std::runtime_error("Pair " + std::to_string(index) + " '" + field +
                                         "' needs numeric latitude and longitude");
            }
            return Position(p["latitude"].get<double>(), p["longitude"].get<double>());
        }
    } // namespace

    std::vector<PositionPair> JsonPairParser::parseFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open JSON file: " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::parse_error &ex)
        {
            throw std::runtime_error("Failed to parse JSON file " + path + ": " + ex.what());
        }

        return parseJson(j);
    }

    std::vector<PositionPair> JsonPairParser::parseString(const std::string &text)
    {
        json j;
        try
        {
            j = json::parse(text);
        }
        catch (const json::parse_error &ex)
        {
            throw std::runtime_error(std::string("Failed to parse JSON: ") + ex.what());
        }
        return parseJson(j);
    }

    std::vector<PositionPair> JsonPairParser::parseJson(const json &j)
    {
        if (!j.is_object() || !j.contains("pairs") || !j["pairs"].is_array())
        {
            throw std::runtime_error("JSON does not contain a pairs array");
        }

        const auto &arr = j["pairs"];

        std::vector<PositionPair> result;
        result.reserve(arr.size());

        for (size_t i = 0; i < arr.size(); ++i)
        {
            const auto &item = arr[i];
            result.push_back(PositionPair{parsePosition(item, "a", i), parsePosition(item, "b", i)});
        }

        return result;
    }

} // namespace core
