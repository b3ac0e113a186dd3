#include "relay/upload/types.hpp"

#include <algorithm>
#include <cctype>

namespace relay::upload {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

const char* to_string(AccountTier tier) noexcept {
    switch (tier) {
        case AccountTier::Regular: return "regular";
        case AccountTier::Premium: return "premium";
    }
    return "regular";
}

const char* to_string(UploadProtocol protocol) noexcept {
    switch (protocol) {
        case UploadProtocol::Small: return "small";
        case UploadProtocol::Big: return "big";
    }
    return "small";
}

const char* to_string(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::FailFast: return "fail_fast";
        case FailurePolicy::CollectAll: return "collect_all";
    }
    return "fail_fast";
}

std::optional<AccountTier> parse_account_tier(const std::string& text) {
    const auto value = lowercase(text);
    if (value == "regular") {
        return AccountTier::Regular;
    }
    if (value == "premium") {
        return AccountTier::Premium;
    }
    return std::nullopt;
}

std::optional<FailurePolicy> parse_failure_policy(const std::string& text) {
    const auto value = lowercase(text);
    if (value == "fail_fast") {
        return FailurePolicy::FailFast;
    }
    if (value == "collect_all") {
        return FailurePolicy::CollectAll;
    }
    return std::nullopt;
}

} // namespace relay::upload
