#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <vectra/client/client_transport.h>
#include <vectra/client/payloads.h>
#include <vectra/core/types.h>

namespace vectra {

// Caller-owned handle to a server-side vector index. Holds no connection;
// every operation is dispatched through the transport that created it.
// Dropping the handle does not delete the index.
class IndexHandle {
public:
    static constexpr std::size_t kDefaultSearchLimit = 10;

    IndexHandle(IndexRef ref, std::shared_ptr<IClientTransport> transport)
        : ref_(std::move(ref)), transport_(std::move(transport)) {}

    const std::string& id() const noexcept { return ref_.id; }
    const std::string& table() const noexcept { return ref_.table; }
    const std::string& column() const noexcept { return ref_.column; }
    const std::string& status() const noexcept { return ref_.status; }
    const IndexRef& ref() const noexcept { return ref_; }

    Result<SearchResult> search(const std::vector<float>& vector,
                                std::optional<std::size_t> limit = std::nullopt) const;
    Result<void> insertVector(std::uint64_t id, const std::vector<float>& vector) const;
    Result<void> deleteIndex() const;

private:
    IndexRef ref_;
    std::shared_ptr<IClientTransport> transport_;
};

// Caller-owned handle to a stream subscription. unsubscribe() may be called
// any number of times.
class SubscriptionHandle {
public:
    SubscriptionHandle(SubscriptionRef ref, std::shared_ptr<IClientTransport> transport)
        : ref_(std::move(ref)), transport_(std::move(transport)) {}

    const std::string& id() const noexcept { return ref_.id; }
    const std::string& topic() const noexcept { return ref_.topic; }
    const std::string& status() const noexcept { return ref_.status; }
    const SubscriptionRef& ref() const noexcept { return ref_; }

    Result<void> unsubscribe() const;

private:
    SubscriptionRef ref_;
    std::shared_ptr<IClientTransport> transport_;
};

} // namespace vectra
