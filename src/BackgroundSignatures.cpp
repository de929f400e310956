#include "BackgroundSignatures.hpp"
#include "Errors.hpp"
#include <map>
#include <numeric>

namespace sigproj {

std::string backgroundSignatureName(int size, int index) {
    return "BG_" + std::to_string(size) + "_" + std::to_string(index);
}

std::vector<Signature> generateBackgroundSignatures(const std::vector<std::string>& genes,
                                                    const std::vector<int>& sizes,
                                                    int repetitions,
                                                    std::mt19937& rng,
                                                    std::vector<std::string>* warnings) {
    if (repetitions < 0) {
        throw ConfigurationError("Background repetitions must be non-negative");
    }

    int universe = genes.size();
    std::vector<int> indices(universe);
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<Signature> signatures;
    for (int size : sizes) {
        if (size <= 0 || size > universe) {
            if (warnings) {
                warnings->push_back("Skipping background signatures of size " + std::to_string(size) +
                                    " for a universe of " + std::to_string(universe) + " genes");
            }
            continue;
        }

        for (int j = 0; j < repetitions; ++j) {
            // Partial Fisher-Yates: the first `size` slots become the sample
            for (int k = 0; k < size; ++k) {
                std::uniform_int_distribution<int> pick(k, universe - 1);
                std::swap(indices[k], indices[pick(rng)]);
            }

            std::map<std::string, int> members;
            for (int k = 0; k < size; ++k) {
                members.emplace(genes[indices[k]], 1);
            }
            signatures.emplace_back(std::move(members), false, "background", backgroundSignatureName(size, j));
        }
    }
    return signatures;
}

} // namespace sigproj
