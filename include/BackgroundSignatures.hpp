#pragma once

#include "Signatures.hpp"
#include <random>
#include <string>
#include <vector>

namespace sigproj {

// Random same-sign signatures used only to build null distributions.
// Names are "BG_<size>_<index>". Sizes larger than the gene universe are skipped.
std::vector<Signature> generateBackgroundSignatures(const std::vector<std::string>& genes,
                                                    const std::vector<int>& sizes,
                                                    int repetitions,
                                                    std::mt19937& rng,
                                                    std::vector<std::string>* warnings = nullptr);

std::string backgroundSignatureName(int size, int index);

} // namespace sigproj
