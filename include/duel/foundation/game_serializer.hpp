#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer providing JSON encoding with schema versioning and
///        compile-time field registration via DUEL_SERIALIZABLE.
///
/// Template-heavy header: the encoding logic operates on user-defined types
/// through SerializableTraits, so it has to live here.

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace duel::foundation {

// ── Forward declarations ────────────────────────────────────────────────────

/// Specialization point for compile-time field registration.
/// Users specialize this via the DUEL_SERIALIZABLE macro.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

// ── Field descriptor ────────────────────────────────────────────────────────

/// Describes a single serializable field: its name and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

/// Create a FieldDescriptor from a name and pointer-to-member.
template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

// ── detail:: implementation helpers ─────────────────────────────────────────

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

// ── Tuple iteration ─────────────────────────────────────────────────────

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t), Is), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

// ── JSON write helpers ──────────────────────────────────────────────────

/// Escape quotes, backslashes and control characters for a JSON string.
std::string escapeJson(std::string_view sv);

template <typename T>
void writeJsonObject(std::ostringstream& out, const T& obj);

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val) {
    if constexpr (is_optional_v<T>) {
        if (val.has_value()) {
            writeJsonValue(out, *val);
        } else {
            out << "null";
        }
    } else if constexpr (is_serializable_v<T>) {
        writeJsonObject(out, val);
    } else if constexpr (std::is_enum_v<T>) {
        writeJsonValue(out, static_cast<std::underlying_type_t<T>>(val));
    } else if constexpr (std::is_same_v<T, bool>) {
        out << (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        out << '"' << escapeJson(val) << '"';
    } else if constexpr (std::is_floating_point_v<T>) {
        out << val;
    } else if constexpr (std::is_signed_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_unsigned_v<T>) {
        out << static_cast<uint64_t>(val);
    }
}

template <typename T>
void writeJsonObject(std::ostringstream& out, const T& obj) {
    out << "{\"__v\":" << SerializableTraits<T>::schema_version;
    auto fields = SerializableTraits<T>::fields();
    forEachField(fields, [&](const auto& fd, std::size_t) {
        out << ",\"" << fd.name << "\":";
        writeJsonValue(out, obj.*(fd.pointer));
    });
    out << '}';
}

}  // namespace detail

// ── GameSerializer ──────────────────────────────────────────────────────────

/// JSON serializer with schema versioning.
///
/// Types must be registered with DUEL_SERIALIZABLE. Nested registered types
/// are written as objects, std::optional as the value or null, enums as
/// their underlying integer.
///
/// Example:
/// @code
///   struct SeatSummary {
///       uint64_t playerId = 0;
///       std::string style;
///   };
///   DUEL_SERIALIZABLE(SeatSummary, 1,
///       field("player_id", &SeatSummary::playerId),
///       field("style", &SeatSummary::style)
///   );
///
///   auto json = GameSerializer::instance().serializeJson(summary);
/// @endcode
class GameSerializer {
public:
    GameSerializer();
    ~GameSerializer();

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;
    GameSerializer(GameSerializer&&) noexcept;
    GameSerializer& operator=(GameSerializer&&) noexcept;

    /// Serialize an object to a JSON string with schema version.
    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with DUEL_SERIALIZABLE");

        std::ostringstream out;
        out.precision(17);
        detail::writeJsonObject(out, obj);
        return out.str();
    }

    /// Access the global GameSerializer instance.
    static GameSerializer& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace duel::foundation

// ── DUEL_SERIALIZABLE macro ─────────────────────────────────────────────────
/// Register a type for serialization with field descriptors and version.
///
/// @param Type     The struct/class type to register (fully qualified).
/// @param Version  Schema version number (uint32_t).
/// @param ...      field("name", &Type::member) descriptors.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DUEL_SERIALIZABLE(Type, Version, ...)                                  \
    template <>                                                                \
    struct duel::foundation::SerializableTraits<Type> {                        \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using duel::foundation::field;                                     \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
