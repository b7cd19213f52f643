#pragma once
#include <string>
#include <vector>
#include <utility>

// Outcome of one realtime fetch: the decoded records, or the reason the
// fetch failed. A failed result never carries records.
template <typename T>
class FeedResult
{
private:
    std::vector<T> records;
    std::string reason;
    bool succeeded;

    FeedResult(std::vector<T> r, std::string why, bool ok)
        : records(std::move(r)), reason(std::move(why)), succeeded(ok) {}

public:
    static FeedResult success(std::vector<T> r)
    {
        return FeedResult(std::move(r), {}, true);
    }

    static FeedResult failure(std::string why)
    {
        return FeedResult({}, std::move(why), false);
    }

    [[nodiscard]] bool ok() const noexcept { return succeeded; }
    [[nodiscard]] std::vector<T> const& value() const noexcept { return records; }
    [[nodiscard]] std::string const& error() const noexcept { return reason; }
};
