#pragma once
#include <string>

// Retrieves the raw body behind a feed URL. Implementations throw
// TransportError on any network or HTTP failure.
class FeedTransport
{
public:
    virtual ~FeedTransport() = default;
    virtual std::string get(std::string const& url) = 0;
};
