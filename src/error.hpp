#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <mw/error.hpp>

// What went wrong, from the point of view of whoever has to decide
// between retrying, rejecting and degrading.
enum class ErrorKind
{
    // The persistent layer could not be read or written.
    STORE_UNAVAILABLE,
    // An inbound activity or event failed authentication.
    SIGNATURE_INVALID,
    // Relay or HTTP I/O failed; the owner of the resource retries.
    TRANSPORT_TRANSIENT,
    // An outbound activity ran out of delivery attempts.
    DELIVERY_EXHAUSTED,
    // A malformed document, event or request.
    INVALID_INPUT,
    NOT_FOUND,
    INTERNAL,
};

struct BridgeError
{
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string msg;

    bool operator==(const BridgeError&) const = default;
};

template<typename T>
using E = std::expected<T, BridgeError>;

BridgeError storeUnavailable(std::string_view msg);
BridgeError signatureInvalid(std::string_view msg);
BridgeError transportTransient(std::string_view msg);
BridgeError deliveryExhausted(std::string_view msg);
BridgeError invalidInput(std::string_view msg);
BridgeError notFound(std::string_view msg);
BridgeError internalError(std::string_view msg);

// Adapters for transform_error() on libmw results.
BridgeError fromStoreError(const mw::Error& e);
BridgeError fromTransportError(const mw::Error& e);
BridgeError fromInternalError(const mw::Error& e);

std::string_view errorKindName(ErrorKind kind);
std::string errorMsg(const BridgeError& e);
// HTTP status the server answers with when a request fails this way.
int httpStatusFor(const BridgeError& e);
