/**
 * @file codec.hpp
 * @brief Payload codecs and the tag‑keyed codec registry.
 *
 * Every payload travels as `[tag][body]`, where the one‑byte tag names
 * the payload type and the body is produced by the codec bound to that
 * tag.  The built‑in codecs and their tags are
 *
 *   | tag    | C++ type         | body                                 |
 *   |--------|------------------|--------------------------------------|
 *   | `0x00` | `std::monostate` | empty                                |
 *   | `0x01` | `Bytes`          | verbatim                             |
 *   | `0x02` | `std::string`    | UTF‑8                                |
 *   | `0x03` | `std::int64_t`   | big‑endian two's complement, 1..8 B  |
 *   | `0x04` | `double`         | big‑endian IEEE‑754, 8 B             |
 *   | `0x05` | `bool`           | `0x00` or `0x01`                     |
 *
 * `0x06` is reserved for protobuf messages (see protobuf_codec.hpp).
 */

#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "message.hpp"

#include <any>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mqroute {

namespace tags {
inline constexpr PayloadTag none = 0x00;
inline constexpr PayloadTag bytes = 0x01;
inline constexpr PayloadTag string = 0x02;
inline constexpr PayloadTag integer = 0x03;
inline constexpr PayloadTag floating = 0x04;
inline constexpr PayloadTag boolean = 0x05;
inline constexpr PayloadTag protobuf = 0x06;
} // namespace tags

// ==========================================================================
// Codec interfaces
// ==========================================================================

/**
 * @brief Type‑erased codec as stored by the registry.
 *
 * Works on payload *bodies*; the tag byte is handled by CodecRegistry.
 */
class PayloadCodec {
  public:
    virtual ~PayloadCodec() = default;

    virtual PayloadTag tag() const = 0;
    virtual std::type_index type() const = 0;
    virtual const std::string& name() const = 0;

    /// @throws EncodeError if @p value does not hold the codec's type.
    virtual Bytes encode_any(const std::any& value) const = 0;
    /// @throws CodecError on a malformed body.
    virtual std::any decode_any(ByteView body) const = 0;
};

/**
 * @brief Convenience base for codecs of one concrete C++ type.
 * @tparam T Copy‑constructible payload type.
 */
template <typename T> class TypedCodec : public PayloadCodec {
  private:
    PayloadTag m_tag;
    std::string m_name;

  public:
    using value_type = T;

    TypedCodec(PayloadTag tag, std::string name)
        : m_tag(tag), m_name(std::move(name)) {}

    PayloadTag tag() const override { return m_tag; }
    std::type_index type() const override { return typeid(T); }
    const std::string& name() const override { return m_name; }

    virtual Bytes encode(const T& value) const = 0;
    virtual T decode(ByteView body) const = 0;

    Bytes encode_any(const std::any& value) const override {
        const auto* typed = std::any_cast<T>(&value);
        if (typed == nullptr) {
            throw EncodeError("codec \"" + m_name +
                              "\" cannot encode a value of type " +
                              value.type().name());
        }
        return encode(*typed);
    }

    std::any decode_any(ByteView body) const override {
        return std::any(decode(body));
    }
};

// ==========================================================================
// Built‑in codecs
// ==========================================================================

namespace detail {
inline void expect_length(const std::string& codec, ByteView body,
                          std::size_t expected) {
    if (body.size() != expected) {
        throw CodecError("invalid " + codec + " payload length: " +
                         std::to_string(body.size()));
    }
}

/// Strict UTF‑8 validation: no overlongs, surrogates or values > U+10FFFF.
inline bool is_valid_utf8(ByteView text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const std::uint8_t lead = text[i];
        std::size_t extra = 0;
        std::uint32_t min_value = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            min_value = 0x80;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            min_value = 0x800;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            min_value = 0x10000;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t next = text[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        if (code_point < min_value || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}
} // namespace detail

class NoneCodec final : public TypedCodec<std::monostate> {
  public:
    NoneCodec() : TypedCodec(tags::none, "none") {}

    Bytes encode(const std::monostate&) const override { return {}; }
    std::monostate decode(ByteView body) const override {
        detail::expect_length(name(), body, 0);
        return {};
    }
};

class BytesCodec final : public TypedCodec<Bytes> {
  public:
    BytesCodec() : TypedCodec(tags::bytes, "bytes") {}

    Bytes encode(const Bytes& value) const override { return value; }
    Bytes decode(ByteView body) const override {
        return Bytes(body.begin(), body.end());
    }
};

class StringCodec final : public TypedCodec<std::string> {
  public:
    StringCodec() : TypedCodec(tags::string, "string") {}

    Bytes encode(const std::string& value) const override {
        return Bytes(value.begin(), value.end());
    }
    std::string decode(ByteView body) const override {
        if (!detail::is_valid_utf8(body)) {
            throw CodecError("failed to decode UTF-8 string");
        }
        return std::string(body.begin(), body.end());
    }
};

/// Minimal‑length big‑endian two's complement integers.
class IntegerCodec final : public TypedCodec<std::int64_t> {
  public:
    IntegerCodec() : TypedCodec(tags::integer, "integer") {}

    Bytes encode(const std::int64_t& value) const override {
        std::size_t length = 1;
        while (length < sizeof(std::int64_t)) {
            const std::int64_t limit = std::int64_t{1} << (8 * length - 1);
            if (value >= -limit && value < limit) {
                break;
            }
            ++length;
        }
        Bytes out(length);
        auto bits = static_cast<std::uint64_t>(value);
        for (std::size_t i = 0; i < length; ++i) {
            out[length - 1 - i] = static_cast<std::uint8_t>(bits & 0xFF);
            bits >>= 8;
        }
        return out;
    }

    std::int64_t decode(ByteView body) const override {
        if (body.empty() || body.size() > sizeof(std::int64_t)) {
            throw CodecError("invalid integer payload length: " +
                             std::to_string(body.size()));
        }
        // Sign‑extend from the most significant byte.
        std::uint64_t bits = (body[0] & 0x80) ? ~std::uint64_t{0} : 0;
        for (auto byte : body) {
            bits = (bits << 8) | byte;
        }
        return static_cast<std::int64_t>(bits);
    }
};

class FloatCodec final : public TypedCodec<double> {
  public:
    FloatCodec() : TypedCodec(tags::floating, "float") {}

    Bytes encode(const double& value) const override {
        auto bits = std::bit_cast<std::uint64_t>(value);
        Bytes out(sizeof(bits));
        for (std::size_t i = 0; i < sizeof(bits); ++i) {
            out[sizeof(bits) - 1 - i] = static_cast<std::uint8_t>(bits & 0xFF);
            bits >>= 8;
        }
        return out;
    }

    double decode(ByteView body) const override {
        detail::expect_length(name(), body, sizeof(std::uint64_t));
        std::uint64_t bits = 0;
        for (auto byte : body) {
            bits = (bits << 8) | byte;
        }
        return std::bit_cast<double>(bits);
    }
};

class BoolCodec final : public TypedCodec<bool> {
  public:
    BoolCodec() : TypedCodec(tags::boolean, "bool") {}

    Bytes encode(const bool& value) const override {
        return Bytes{static_cast<std::uint8_t>(value ? 0x01 : 0x00)};
    }
    bool decode(ByteView body) const override {
        detail::expect_length(name(), body, 1);
        if (body[0] > 0x01) {
            throw CodecError("invalid bool payload value: " +
                             std::to_string(body[0]));
        }
        return body[0] == 0x01;
    }
};

// ==========================================================================
// CodecRegistry
// ==========================================================================

/**
 * @brief Binds codecs to payload tags and C++ types; frames payloads.
 *
 * Populated during start‑up and read‑only afterwards, so lookups on the
 * dispatch path take no lock.
 */
class CodecRegistry {
  public:
    using CodecPtr = std::shared_ptr<const PayloadCodec>;

  private:
    std::vector<CodecPtr> m_codecs; ///< Registration order.
    std::unordered_map<PayloadTag, CodecPtr> m_by_tag;
    std::unordered_map<std::type_index, CodecPtr> m_by_type;
    std::size_t m_max_payload_size;

  public:
    explicit CodecRegistry(
        std::size_t max_payload_size = defaults::max_payload_size)
        : m_max_payload_size(max_payload_size) {}

    /// Registry pre‑loaded with the six built‑in codecs.
    static CodecRegistry
    with_builtins(std::size_t max_payload_size = defaults::max_payload_size) {
        CodecRegistry registry(max_payload_size);
        registry.add(std::make_shared<NoneCodec>());
        registry.add(std::make_shared<BoolCodec>());
        registry.add(std::make_shared<BytesCodec>());
        registry.add(std::make_shared<StringCodec>());
        registry.add(std::make_shared<IntegerCodec>());
        registry.add(std::make_shared<FloatCodec>());
        return registry;
    }

    /**
     * @brief Bind @p codec to its tag and type.
     * @param replace Replace a codec already bound to the same tag.
     * @throws CodecError if the tag is taken (and @p replace is false) or
     *         the C++ type is already bound under another tag.
     */
    void add(CodecPtr codec, bool replace = false) {
        if (!codec) {
            throw CodecError("cannot register a null codec");
        }
        const auto tag = codec->tag();
        auto existing = m_by_tag.find(tag);
        if (existing != m_by_tag.end() && !replace) {
            throw CodecError("codec tag already registered: " +
                             std::to_string(tag));
        }
        auto by_type = m_by_type.find(codec->type());
        if (by_type != m_by_type.end() && by_type->second->tag() != tag) {
            throw CodecError("payload type of codec \"" + codec->name() +
                             "\" is already bound to tag " +
                             std::to_string(by_type->second->tag()));
        }

        if (existing != m_by_tag.end()) {
            m_by_type.erase(existing->second->type());
            for (auto& current : m_codecs) {
                if (current->tag() == tag) {
                    current = codec;
                    break;
                }
            }
        } else {
            m_codecs.push_back(codec);
        }
        m_by_tag[tag] = codec;
        m_by_type[codec->type()] = std::move(codec);
    }

    const PayloadCodec* find(PayloadTag tag) const {
        auto it = m_by_tag.find(tag);
        return it == m_by_tag.end() ? nullptr : it->second.get();
    }

    const PayloadCodec* find(std::type_index type) const {
        auto it = m_by_type.find(type);
        return it == m_by_type.end() ? nullptr : it->second.get();
    }

    /// Codec bound to exactly @p T.
    template <typename T> const PayloadCodec* find() const {
        return find(std::type_index(typeid(T)));
    }

    std::size_t size() const { return m_codecs.size(); }
    std::size_t max_payload_size() const { return m_max_payload_size; }

    /**
     * @brief Frame @p value as `[tag][body]` using @p codec.
     * @throws EncodeError on a type mismatch or codec failure.
     */
    Bytes encode(const PayloadCodec& codec, const std::any& value) const {
        Bytes body;
        try {
            body = codec.encode_any(value);
        } catch (const EncodeError&) {
            throw;
        } catch (const std::exception& error) {
            throw EncodeError("codec \"" + codec.name() +
                              "\" failed: " + error.what());
        } catch (...) {
            throw EncodeError("codec \"" + codec.name() +
                              "\" failed: non-standard exception");
        }
        if (body.size() > m_max_payload_size) {
            throw EncodeError("payload size exceeds maximum limit: " +
                              std::to_string(body.size()) + " bytes");
        }
        Bytes framed;
        framed.reserve(body.size() + 1);
        framed.push_back(codec.tag());
        framed.insert(framed.end(), body.begin(), body.end());
        return framed;
    }

    /// @throws EncodeError if no codec is bound to the value's type.
    template <typename T> Bytes encode(T&& value) const {
        using Value = detail::payload_value_t<T>;
        const auto* codec = find<Value>();
        if (codec == nullptr) {
            throw EncodeError(std::string("no codec bound for type ") +
                              typeid(Value).name());
        }
        return encode(*codec, std::any(Value(std::forward<T>(value))));
    }

    /**
     * @brief Decode framed @p data that must carry @p expected as tag.
     * @throws CodecError on empty or oversized data, a tag mismatch, an
     *         unknown tag or a malformed body.
     */
    std::any decode(PayloadTag expected, ByteView data) const {
        if (data.empty()) {
            throw CodecError("cannot decode empty data");
        }
        if (data.size() - 1 > m_max_payload_size) {
            throw CodecError("payload size exceeds maximum limit: " +
                             std::to_string(data.size() - 1) + " bytes");
        }
        if (data[0] != expected) {
            throw CodecError("payload tag " + std::to_string(data[0]) +
                             " does not match expected tag " +
                             std::to_string(expected));
        }
        const auto* codec = find(expected);
        if (codec == nullptr) {
            throw CodecError("unrecognised payload tag: " +
                             std::to_string(expected));
        }
        return codec->decode_any(data.subspan(1));
    }

    template <typename T> T decode(ByteView data) const {
        const auto* codec = find<T>();
        if (codec == nullptr) {
            throw CodecError(std::string("no codec bound for type ") +
                             typeid(T).name());
        }
        return std::any_cast<T>(decode(codec->tag(), data));
    }
};

} // namespace mqroute
