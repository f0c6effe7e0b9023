#pragma once

#include <string>

// Display-only result of a host lookup. Every failure is folded into the
// "unknown" sentinel; callers never see the underlying error.
class ResolvedAddress {
public:
    static ResolvedAddress of(std::string address);
    static ResolvedAddress unknown();

    bool known() const { return known_; }

    // Dotted address, or "unknown"
    const std::string& str() const { return text_; }

private:
    ResolvedAddress(std::string text, bool known)
        : text_(std::move(text)), known_(known) {}

    std::string text_;
    bool known_;
};

class HostResolver {
public:
    virtual ~HostResolver() = default;

    // Forward lookup of host. Never throws.
    virtual ResolvedAddress resolve(const std::string& host) = 0;
};

// IPv4 lookup through the system resolver (getaddrinfo)
class SystemResolver : public HostResolver {
public:
    ResolvedAddress resolve(const std::string& host) override;
};
