// SPDX-License-Identifier: Apache-2.0
#include "dnssd_browser.hpp"

#include <everest/logging.hpp>

#include <dns_sd.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>

#include <algorithm>
#include <cerrno>
#include <list>
#include <memory>

namespace evselink {

namespace {

constexpr auto MAX_SELECT_SLICE = std::chrono::milliseconds(100);

struct BrowseSession;

struct PendingResolve {
    BrowseSession* session{nullptr};
    std::string name;
    DNSServiceRef ref{nullptr};
    bool finished{false};
};

struct BrowseSession {
    const ServiceBrowser::FoundHandler* on_found{nullptr};
    std::list<PendingResolve> resolves;
};

std::vector<std::string> lookup_ipv4(const char* host) {
    std::vector<std::string> out;
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host, nullptr, &hints, &res) != 0) {
        return out;
    }
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        auto* sa = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf))) {
            std::string addr(buf);
            if (std::find(out.begin(), out.end(), addr) == out.end()) {
                out.push_back(addr);
            }
        }
    }
    freeaddrinfo(res);
    return out;
}

void DNSSD_API resolve_reply(DNSServiceRef, DNSServiceFlags, uint32_t, DNSServiceErrorType err, const char*,
                             const char* host_target, uint16_t port, uint16_t, const unsigned char*, void* context) {
    auto* pending = static_cast<PendingResolve*>(context);
    pending->finished = true;
    if (err != kDNSServiceErr_NoError || !host_target) {
        return;
    }
    ServiceAnnouncement announcement;
    announcement.name = pending->name;
    announcement.port = ntohs(port);
    announcement.addresses = lookup_ipv4(host_target);
    if (announcement.addresses.empty()) {
        EVLOG_debug << "mDNS: no IPv4 address for " << host_target;
        return;
    }
    (*pending->session->on_found)(announcement);
}

void DNSSD_API browse_reply(DNSServiceRef, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType err,
                            const char* name, const char* regtype, const char* domain, void* context) {
    if (err != kDNSServiceErr_NoError || !(flags & kDNSServiceFlagsAdd) || !name) {
        return;
    }
    auto* session = static_cast<BrowseSession*>(context);
    session->resolves.push_back(PendingResolve{session, name, nullptr, false});
    auto& pending = session->resolves.back();
    const auto rc = DNSServiceResolve(&pending.ref, 0, interface_index, name, regtype, domain, resolve_reply, &pending);
    if (rc != kDNSServiceErr_NoError) {
        pending.ref = nullptr;
        pending.finished = true;
    }
}

} // namespace

bool DnsSdServiceBrowser::browse(const std::string& service_type, std::chrono::milliseconds window,
                                 const FoundHandler& on_found) {
    BrowseSession session;
    session.on_found = &on_found;

    DNSServiceRef browse_ref = nullptr;
    const auto err = DNSServiceBrowse(&browse_ref, 0, kDNSServiceInterfaceIndexAny, service_type.c_str(), nullptr,
                                      browse_reply, &session);
    if (err != kDNSServiceErr_NoError) {
        EVLOG_warning << "DNSServiceBrowse(" << service_type << ") failed: " << err;
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        fd_set readfds;
        FD_ZERO(&readfds);
        int max_fd = DNSServiceRefSockFD(browse_ref);
        FD_SET(max_fd, &readfds);
        for (const auto& pending : session.resolves) {
            if (pending.ref && !pending.finished) {
                const int fd = DNSServiceRefSockFD(pending.ref);
                FD_SET(fd, &readfds);
                max_fd = std::max(max_fd, fd);
            }
        }

        const auto slice =
            std::min(MAX_SELECT_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        timeval tv{};
        tv.tv_sec = static_cast<long>(slice.count() / 1000);
        tv.tv_usec = static_cast<long>((slice.count() % 1000) * 1000);
        const int ready = select(max_fd + 1, &readfds, nullptr, nullptr, &tv);
        if (ready < 0) {
            if (errno == EINTR) continue;
            EVLOG_warning << "mDNS select failed";
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (FD_ISSET(DNSServiceRefSockFD(browse_ref), &readfds)) {
            if (DNSServiceProcessResult(browse_ref) != kDNSServiceErr_NoError) {
                break;
            }
        }
        for (auto& pending : session.resolves) {
            if (pending.ref && !pending.finished && FD_ISSET(DNSServiceRefSockFD(pending.ref), &readfds)) {
                if (DNSServiceProcessResult(pending.ref) != kDNSServiceErr_NoError) {
                    pending.finished = true;
                }
            }
        }
        for (auto& pending : session.resolves) {
            if (pending.ref && pending.finished) {
                DNSServiceRefDeallocate(pending.ref);
                pending.ref = nullptr;
            }
        }
    }

    for (auto& pending : session.resolves) {
        if (pending.ref) {
            DNSServiceRefDeallocate(pending.ref);
            pending.ref = nullptr;
        }
    }
    DNSServiceRefDeallocate(browse_ref);
    return true;
}

std::optional<std::string> InterfaceHostNetwork::local_ipv4() {
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        return std::nullopt;
    }
    std::optional<std::string> ip;
    for (auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        auto* sa = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (sa->sin_addr.s_addr == htonl(INADDR_LOOPBACK)) continue;
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf))) {
            ip = buf;
            break;
        }
    }
    freeifaddrs(ifaddr);
    return ip;
}

} // namespace evselink
