#include "domain/global_id_generator.h"
#include "domain/hex_validator.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"

namespace ulagen::domain {

using infrastructure::InternalInvariantException;

GlobalIdGenerator::GlobalIdGenerator(std::shared_ptr<const IHashFunction> sha1)
    : sha1_(std::move(sha1)) {
    if (!sha1_) {
        THROW_INTERNAL_ERROR("global ID generator requires a hash function");
    }
}

std::vector<uint8_t> GlobalIdGenerator::hash_input(const NtpTimestamp& timestamp, const Eui64& eui64) {
    return decode_hex(timestamp.hex() + eui64.hex());
}

GlobalId GlobalIdGenerator::derive(const NtpTimestamp& timestamp, const Eui64& eui64) const {
    auto input = hash_input(timestamp, eui64);
    auto digest = sha1_->digest(input);

    if (digest.size() * 2 < GLOBAL_ID_HEX_LENGTH) {
        THROW_INTERNAL_ERROR(sha1_->name() + " produced a " + std::to_string(digest.size()) +
                             "-byte digest, too short for a 40-bit global ID");
    }

    std::string digest_hex = encode_hex(digest);
    GlobalId global_id(digest_hex.substr(digest_hex.size() - GLOBAL_ID_HEX_LENGTH));

    LOG_DEBUG("global_id", "hashed timestamp and EUI-64",
              {{"input", encode_hex(input)}, {"digest", digest_hex}, {"global_id", global_id.hex()}});
    return global_id;
}

}
