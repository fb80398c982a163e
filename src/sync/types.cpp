#include "docsync/sync/types.hpp"

namespace docsync::sync {
namespace {

struct EventNamer {
    const char* operator()(const RemoteInsert&) const { return "RemoteInsert"; }
    const char* operator()(const LocalInsert&) const { return "LocalInsert"; }
    const char* operator()(const ContentReady&) const { return "ContentReady"; }
    const char* operator()(const AllClear&) const { return "AllClear"; }
    const char* operator()(const PeerJoined&) const { return "PeerJoined"; }
    const char* operator()(const PeerLeft&) const { return "PeerLeft"; }
    const char* operator()(const RoundComplete&) const { return "RoundComplete"; }
};

} // namespace

const char* event_name(const DocEvent& event) {
    return std::visit(EventNamer{}, event);
}

const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Starting: return "Starting";
        case SessionPhase::CatchingUp: return "CatchingUp";
        case SessionPhase::MetadataCaughtUp: return "MetadataCaughtUp";
    }
    return "Unknown";
}

const char* to_string(ContentPhase phase) {
    switch (phase) {
        case ContentPhase::ContentPending: return "ContentPending";
        case ContentPhase::FullyMaterialized: return "FullyMaterialized";
    }
    return "Unknown";
}

} // namespace docsync::sync
