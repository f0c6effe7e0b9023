#include "resolver.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <fmt/format.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <netdb.h>
#  include <arpa/inet.h>
#  include <netinet/in.h>
#endif

ResolvedAddress ResolvedAddress::of(std::string address) {
    return ResolvedAddress(std::move(address), true);
}

ResolvedAddress ResolvedAddress::unknown() {
    return ResolvedAddress(UNKNOWN_ADDRESS, false);
}

#ifdef _WIN32
namespace {
// WSAStartup once per process; getaddrinfo fails without it.
struct WinsockInit {
    bool ok = false;
    WinsockInit() {
        WSADATA data;
        ok = WSAStartup(MAKEWORD(2, 2), &data) == 0;
    }
    ~WinsockInit() { if (ok) WSACleanup(); }
};
}
#endif

ResolvedAddress SystemResolver::resolve(const std::string& host) {
#ifdef _WIN32
    static WinsockInit winsock;
    if (!winsock.ok) return ResolvedAddress::unknown();
#endif
    if (host.empty()) return ResolvedAddress::unknown();

    struct addrinfo hints = {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        rcr_log(fmt::format("resolve: {} failed: {}", host, gai_strerror(rc)));
        if (res) freeaddrinfo(res);
        return ResolvedAddress::unknown();
    }

    char buf[INET_ADDRSTRLEN] = {};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    const char* text = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(res);

    if (!text) return ResolvedAddress::unknown();
    rcr_log(fmt::format("resolve: {} -> {}", host, text));
    return ResolvedAddress::of(text);
}
