#include "DataStructures.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace sigproj {

int QCReport::numPassing() const {
    return static_cast<int>(std::count(passes.begin(), passes.end(), true));
}

const Model& AnalysisResult::model(const std::string& name) const {
    for (const auto& m : models) {
        if (m.name == name) {
            return m;
        }
    }
    throw ProcessingError("No model named " + name);
}

std::string modelKindName(ModelKind kind) {
    switch (kind) {
        case ModelKind::EXPRESSION:
            return "Expression";
        case ModelKind::PROBABILITY:
            return "Probability";
        default:
            throw ProcessingError("Unknown model kind");
    }
}

} // namespace sigproj
