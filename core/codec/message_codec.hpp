#ifndef TACTILE_CODEC_MESSAGE_CODEC_HPP
#define TACTILE_CODEC_MESSAGE_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "protocol.pb.h"
#include "session/message.hpp"

namespace tactile {
namespace codec {

/**
 * MessageCodec - session::Message <-> protobuf Envelope bytes.
 *
 * Lossless for id, kind and payload. A well-formed frame whose payload (or
 * device command variant, or actuator kind) this server does not know decodes
 * to session::Unrecognized carrying the frame's id. decode() only fails on
 * bytes that are not a valid Envelope.
 */
class MessageCodec {
public:
    static bool encode(const session::Message &message, std::vector<uint8_t> &bytes, std::string &error);
    static bool decode(const std::vector<uint8_t> &bytes, session::Message &message, std::string &error);

    // Envelope-level conversions (exposed for tests and tooling)
    static void to_envelope(const session::Message &message, tactile::wire::v1::Envelope &envelope);
    static session::Message from_envelope(const tactile::wire::v1::Envelope &envelope);

    static tactile::wire::v1::ErrorCode to_wire(device::ErrorCode code);
    static device::ErrorCode from_wire(tactile::wire::v1::ErrorCode code);
};

}  // namespace codec
}  // namespace tactile

#endif  // TACTILE_CODEC_MESSAGE_CODEC_HPP
