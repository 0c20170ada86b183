// SPDX-License-Identifier: Apache-2.0
#include "wire_interface.hpp"

namespace evselink {

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TransportOpen:
        return "TransportOpenError";
    case ErrorKind::TransportTimeout:
        return "TransportTimeoutError";
    case ErrorKind::Decode:
        return "DecodeError";
    case ErrorKind::Pair:
        return "PairError";
    case ErrorKind::DiscoveryProbe:
        return "DiscoveryProbeError";
    case ErrorKind::Publish:
        return "PublishError";
    case ErrorKind::Command:
        return "CommandError";
    }
    return "UnknownError";
}

} // namespace evselink
