#include "commands.hpp"   // Our own header: payloads, packet aliases, command objects

namespace v5link {

// ============================================================================
// Product helpers
// ============================================================================

const char* product_name(uint8_t product_type) {
    switch (product_type) {
        case static_cast<uint8_t>(ProductType::Brain):      return "brain";
        case static_cast<uint8_t>(ProductType::Controller): return "controller";
        default:                                            return "unknown";
    }
}

bool is_known_product(uint8_t product_type) {
    return product_type == static_cast<uint8_t>(ProductType::Brain) ||
           product_type == static_cast<uint8_t>(ProductType::Controller);
}

// ============================================================================
// Payload codecs
// ============================================================================
// Fields go out in declaration order. The first failing field stops the encode.

EncodeError SystemVersion::encode(Bytes& out) const {
    if (auto e = version.encode(out); e != EncodeError::None) return e;
    out.push_back(product_type);
    out.push_back(flags);
    return EncodeError::None;
}

DecodeError SystemVersion::decode(ByteReader& in, SystemVersion& out) {
    if (auto e = Version::decode(in, out.version); !e.ok()) return e;
    if (auto e = decode_from(in, out.product_type); !e.ok()) return e;
    return decode_from(in, out.flags);
}

EncodeError KeyValueSavePayload::encode(Bytes& out) const {
    if (auto e = key.encode(out); e != EncodeError::None) return e;
    return value.encode(out);
}

DecodeError KeyValueSavePayload::decode(ByteReader& in, KeyValueSavePayload& out) {
    if (auto e = KvKey::decode(in, out.key); !e.ok()) return e;
    return KvValue::decode(in, out.value);
}

EncodeError EraseFilePayload::encode(Bytes& out) const {
    out.push_back(vendor);
    out.push_back(option);
    return file_name.encode(out);
}

DecodeError EraseFilePayload::decode(ByteReader& in, EraseFilePayload& out) {
    if (auto e = decode_from(in, out.vendor); !e.ok()) return e;
    if (auto e = decode_from(in, out.option); !e.ok()) return e;
    return decode_from(in, out.file_name);
}

EncodeError LoadFileActionPayload::encode(Bytes& out) const {
    out.push_back(vendor);
    out.push_back(action);
    return file_name.encode(out);
}

DecodeError LoadFileActionPayload::decode(ByteReader& in, LoadFileActionPayload& out) {
    if (auto e = decode_from(in, out.vendor); !e.ok()) return e;
    if (auto e = decode_from(in, out.action); !e.ok()) return e;
    return decode_from(in, out.file_name);
}

// ============================================================================
// Command execution
// ============================================================================
// Argument checks happen here so a bad key or name never reaches the wire.

ConnectionError GetSystemVersion::execute(Connection& conn, Output& out) const {
    GetSystemVersionReplyPacket reply;
    auto e = conn.packet_handshake(opts.timeout, opts.retries, GetSystemVersionPacket{}, reply);
    if (e.ok()) out = reply.payload;
    return e;
}

ConnectionError KeyValueLoad::execute(Connection& conn, Output& out) const {
    KeyValueLoadPacket req;
    if (auto e = KvKey::make(key, req.payload); e != EncodeError::None) return from_encode(e);

    KeyValueLoadReplyPacket reply;
    auto e = conn.packet_handshake(opts.timeout, opts.retries, req, reply);
    if (e.ok()) out = reply.payload.str();
    return e;
}

ConnectionError KeyValueSave::execute(Connection& conn, Output&) const {
    KeyValueSavePacket req;
    if (auto e = KvKey::make(key, req.payload.key); e != EncodeError::None) return from_encode(e);
    if (auto e = KvValue::make(value, req.payload.value); e != EncodeError::None) return from_encode(e);

    KeyValueSaveReplyPacket reply;
    return conn.packet_handshake(opts.timeout, opts.retries, req, reply);
}

ConnectionError EraseFile::execute(Connection& conn, Output&) const {
    EraseFilePacket req;
    req.payload.vendor = static_cast<uint8_t>(vendor);
    if (auto e = TerminatedFixedLengthString<23>::make(file_name, req.payload.file_name);
        e != EncodeError::None) {
        return from_encode(e);
    }

    EraseFileReplyPacket reply;
    return conn.packet_handshake(opts.timeout, opts.retries, req, reply);
}

ConnectionError LoadFileAction::execute(Connection& conn, Output&) const {
    LoadFileActionPacket req;
    req.payload.vendor = static_cast<uint8_t>(vendor);
    req.payload.action = static_cast<uint8_t>(action);
    if (auto e = FileName23::make(file_name, req.payload.file_name); e != EncodeError::None) {
        return from_encode(e);
    }

    LoadFileActionReplyPacket reply;
    return conn.packet_handshake(opts.timeout, opts.retries, req, reply);
}

} // namespace v5link
