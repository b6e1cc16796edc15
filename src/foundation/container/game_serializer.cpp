/// @file game_serializer.cpp
/// @brief JSON string escaping and the GameSerializer instance.

#include "duel/foundation/game_serializer.hpp"

namespace duel::foundation {

namespace detail {

std::string escapeJson(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

} // namespace detail

struct GameSerializer::Impl {};

GameSerializer::GameSerializer() : impl_(std::make_unique<Impl>()) {}

GameSerializer::~GameSerializer() = default;

GameSerializer::GameSerializer(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::operator=(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace duel::foundation
