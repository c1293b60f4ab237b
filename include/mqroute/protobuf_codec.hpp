/**
 * @file protobuf_codec.hpp
 * @brief Codec for generated protobuf message classes.
 *
 * Only available when the build links protobuf (`MQROUTE_WITH_PROTOBUF`).
 * Each message class needs its own tag; the first one conventionally
 * takes @ref tags::protobuf.
 */

#pragma once

#include "codec.hpp"

#include <google/protobuf/message_lite.h>

#include <string>
#include <type_traits>

namespace mqroute {

template <typename Message>
class ProtobufCodec final : public TypedCodec<Message> {
    static_assert(std::is_base_of_v<google::protobuf::MessageLite, Message>,
                  "ProtobufCodec requires a generated protobuf message");

  public:
    explicit ProtobufCodec(PayloadTag tag = tags::protobuf)
        : TypedCodec<Message>(
              tag, "protobuf:" + std::string(Message().GetTypeName())) {}

    Bytes encode(const Message& value) const override {
        std::string serialized;
        if (!value.SerializeToString(&serialized)) {
            throw EncodeError("cannot serialize " + value.GetTypeName() +
                              ": missing required fields");
        }
        return Bytes(serialized.begin(), serialized.end());
    }

    Message decode(ByteView body) const override {
        Message message;
        if (!message.ParseFromArray(body.data(),
                                    static_cast<int>(body.size()))) {
            throw CodecError("cannot parse " + message.GetTypeName());
        }
        return message;
    }
};

} // namespace mqroute
