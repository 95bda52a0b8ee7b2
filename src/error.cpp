#include <format>
#include <string>
#include <string_view>
#include <variant>

#include <mw/error.hpp>

#include "error.hpp"

BridgeError storeUnavailable(std::string_view msg)
{
    return {ErrorKind::STORE_UNAVAILABLE, std::string(msg)};
}

BridgeError signatureInvalid(std::string_view msg)
{
    return {ErrorKind::SIGNATURE_INVALID, std::string(msg)};
}

BridgeError transportTransient(std::string_view msg)
{
    return {ErrorKind::TRANSPORT_TRANSIENT, std::string(msg)};
}

BridgeError deliveryExhausted(std::string_view msg)
{
    return {ErrorKind::DELIVERY_EXHAUSTED, std::string(msg)};
}

BridgeError invalidInput(std::string_view msg)
{
    return {ErrorKind::INVALID_INPUT, std::string(msg)};
}

BridgeError notFound(std::string_view msg)
{
    return {ErrorKind::NOT_FOUND, std::string(msg)};
}

BridgeError internalError(std::string_view msg)
{
    return {ErrorKind::INTERNAL, std::string(msg)};
}

BridgeError fromStoreError(const mw::Error& e)
{
    return storeUnavailable(mw::errorMsg(e));
}

BridgeError fromTransportError(const mw::Error& e)
{
    return transportTransient(mw::errorMsg(e));
}

BridgeError fromInternalError(const mw::Error& e)
{
    return internalError(mw::errorMsg(e));
}

std::string_view errorKindName(ErrorKind kind)
{
    switch(kind)
    {
    case ErrorKind::STORE_UNAVAILABLE:
        return "StoreUnavailable";
    case ErrorKind::SIGNATURE_INVALID:
        return "SignatureInvalid";
    case ErrorKind::TRANSPORT_TRANSIENT:
        return "TransportTransient";
    case ErrorKind::DELIVERY_EXHAUSTED:
        return "DeliveryExhausted";
    case ErrorKind::INVALID_INPUT:
        return "InvalidInput";
    case ErrorKind::NOT_FOUND:
        return "NotFound";
    case ErrorKind::INTERNAL:
        return "Internal";
    }
    return "Unknown";
}

std::string errorMsg(const BridgeError& e)
{
    return std::format("{}: {}", errorKindName(e.kind), e.msg);
}

int httpStatusFor(const BridgeError& e)
{
    switch(e.kind)
    {
    case ErrorKind::SIGNATURE_INVALID:
        return 401;
    case ErrorKind::INVALID_INPUT:
        return 400;
    case ErrorKind::NOT_FOUND:
        return 404;
    case ErrorKind::STORE_UNAVAILABLE:
        return 503;
    case ErrorKind::TRANSPORT_TRANSIENT:
        return 502;
    case ErrorKind::DELIVERY_EXHAUSTED:
    case ErrorKind::INTERNAL:
        return 500;
    }
    return 500;
}
