#pragma once

#include <map>
#include <string>

namespace sb
{
// Tag n-gram counts of an HTML document; falls back to word n-grams when the
// text has no tags.
std::map<std::string, int> structure_features(const std::string &html,
                                              int dimension = 2);

// Cosine similarity of two feature vectors, in [0, 1].
double cosine_similarity(const std::map<std::string, int> &a,
                         const std::map<std::string, int> &b);

// Identical texts are always similar.
bool is_similar(const std::string &a,
                const std::string &b,
                double threshold = 0.8);
} // namespace sb
