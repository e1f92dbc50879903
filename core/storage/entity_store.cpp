#include "storage/entity_store.hpp"

namespace landscape {

Transaction::Transaction(EntityStore& store) : store_(store) {
    store_.begin();
}

Transaction::~Transaction() {
    if (!active_) return;
    try {
        store_.rollback();
    } catch (const StoreError&) {
        // Nothing left to undo; the savepoint is gone with the failed store.
    }
}

void Transaction::commit() {
    if (!active_) throw StoreError("Transaction already finished");
    store_.commit();
    active_ = false;
}

void Transaction::rollback() {
    if (!active_) throw StoreError("Transaction already finished");
    active_ = false;
    store_.rollback();
}

} // namespace landscape
