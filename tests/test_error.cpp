#include <doctest/doctest.h>
#include "v5link/error.hpp"

#include <cerrno>
#include <string>

using namespace v5link;

TEST_CASE("reason strings are stable") {
    CHECK(std::string(to_string(ErrorKind::Io)) == "io");
    CHECK(std::string(to_string(ErrorKind::Timeout)) == "timeout");
    CHECK(std::string(to_string(ErrorKind::Nack)) == "nack");
    CHECK(std::string(to_string(ErrorKind::NoWriteOnWireless)) == "no_write_on_wireless");
    CHECK(std::string(to_string(ErrorKind::InvalidMagic)) == "invalid_magic");
    CHECK(std::string(to_string(ErrorKind::NotConnected)) == "not_connected");
    CHECK(std::string(to_string(ErrorKind::NoBluetoothAdapter)) == "no_bluetooth_adapter");
    CHECK(std::string(to_string(ErrorKind::MissingCharacteristic)) == "missing_characteristic");
    CHECK(std::string(to_string(ErrorKind::IncorrectPin)) == "incorrect_pin");
    CHECK(std::string(to_string(ErrorKind::AuthenticationRequired)) == "authentication_required");
}

TEST_CASE("decode errors map onto connection errors") {
    CHECK(from_decode(DecodeError::none()).ok());
    CHECK(from_decode(DecodeError::make(DecodeErrorKind::InvalidHeader)).kind == ErrorKind::InvalidMagic);
    CHECK(from_decode(DecodeError::make(DecodeErrorKind::UnexpectedEnd)).kind == ErrorKind::Decode);
    CHECK(from_decode(DecodeError::make(DecodeErrorKind::ChecksumMismatch)).kind == ErrorKind::Decode);

    ConnectionError nack = from_decode(DecodeError::make(DecodeErrorKind::Nack, 0xD0));
    CHECK(nack.kind == ErrorKind::Nack);
    CHECK(nack.nack == 0xD0);

    ConnectionError id = from_decode(DecodeError::make(DecodeErrorKind::UnexpectedId, 0x22));
    CHECK(id.kind == ErrorKind::Decode);
    CHECK(id.decode.detail == 0x22);
}

TEST_CASE("encode errors and errno map onto connection errors") {
    CHECK(from_encode(EncodeError::None).ok());
    ConnectionError e = from_encode(EncodeError::StringTooLong);
    CHECK(e.kind == ErrorKind::Encode);
    CHECK(e.encode == EncodeError::StringTooLong);

    ConnectionError io = from_errno(EIO);
    CHECK(io.kind == ErrorKind::Io);
    CHECK(io.os_errno == EIO);
}

TEST_CASE("describe renders key=value details") {
    CHECK(describe(ConnectionError::of(ErrorKind::Timeout)) == "reason=timeout");
    CHECK(describe(from_decode(DecodeError::make(DecodeErrorKind::Nack, 0xDB))) ==
          "reason=nack code=0xdb ack=nack_file_already_exists");
    CHECK(describe(from_encode(EncodeError::VarShortTooLarge)) == "reason=encode encode=var_short_too_large");
    CHECK(describe(from_decode(DecodeError::make(DecodeErrorKind::UnexpectedId, 0x22))) ==
          "reason=decode decode=unexpected_id got=0x22");

    const std::string io = describe(from_errno(EIO));
    CHECK(io.rfind("reason=io errno=", 0) == 0);
}
