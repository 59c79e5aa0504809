#include <vectra/client/resource_handles.h>

namespace vectra {

Result<SearchResult> IndexHandle::search(const std::vector<float>& vector,
                                         std::optional<std::size_t> limit) const {
    const std::size_t effective = limit.value_or(kDefaultSearchLimit);
    if (effective == 0) {
        return Error{ErrorCode::ValidationError, "search limit must be at least 1"};
    }
    if (!transport_) {
        return makeTransportError("Failed to search index", "handle has no owning client");
    }
    return transport_->searchIndex(ref_, vector, effective);
}

Result<void> IndexHandle::insertVector(std::uint64_t id, const std::vector<float>& vector) const {
    if (!transport_) {
        return makeTransportError("Failed to insert vector", "handle has no owning client");
    }
    return transport_->insertVector(ref_, id, vector);
}

Result<void> IndexHandle::deleteIndex() const {
    if (!transport_) {
        return makeTransportError("Failed to delete index", "handle has no owning client");
    }
    return transport_->deleteIndex(ref_);
}

Result<void> SubscriptionHandle::unsubscribe() const {
    if (!transport_) {
        return makeTransportError("Failed to unsubscribe", "handle has no owning client");
    }
    return transport_->unsubscribe(ref_);
}

} // namespace vectra
