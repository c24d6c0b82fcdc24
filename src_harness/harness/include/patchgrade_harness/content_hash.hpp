#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace patchgrade::harness {

/**
 * \brief Incremental SHA-256 over length-prefixed fields.
 *
 * Every field is folded as `<decimal length>:<bytes>` so that adjacent fields
 * can never be confused with one another (`["ab","c"]` and `["a","bc"]` hash
 * differently).
 */
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    ContentHasher& field(std::string_view bytes);

    /// Finalises the digest; the hasher cannot be fed afterwards.
    [[nodiscard]] std::string hex_digest();

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
    bool finished_{false};
};

}  // namespace patchgrade::harness
