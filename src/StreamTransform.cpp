#include "sealstream/StreamTransform.hpp"

namespace sealstream {

const char* toString(const TransformState state) {
    switch (state) {
        case TransformState::Init: return "Init";
        case TransformState::Processing: return "Processing";
        case TransformState::Finalized: return "Finalized";
        case TransformState::Failed: return "Failed";
        case TransformState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

}
