#ifndef JSON_PAIR_PARSER_H
#define JSON_PAIR_PARSER_H

#include "Position.h"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace core
{
    struct PositionPair
    {
        Position a;
        Position b;
    };

    class JsonPairParser
    {
    public:
        // Expects {"pairs": [{"a": {"latitude": .., "longitude": ..}, "b": {...}}, ...]}
        static std::vector<PositionPair> parseFile(const std::string &path);
        static std::vector<PositionPair> parseJson(const nlohmann::json &j);
        static std::vector<PositionPair> parseString(const std::string &text);
    };
} // namespace core

#endif // JSON_PAIR_PARSER_H
