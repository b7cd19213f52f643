#pragma once
#include <stdexcept>
#include <string>

// Network or HTTP level failure while fetching a realtime feed.
class TransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Payload is not a valid GTFS-realtime FeedMessage.
class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Static archive table lacks a required column or holds an unparsable value.
class DataFormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Static archive, or a named table inside it, does not exist.
class NotFoundError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed user input: coordinates, stop ids.
class InvalidInputError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
