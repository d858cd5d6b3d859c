#ifndef RQHARNESS_VECTOR_GENERATOR_H
#define RQHARNESS_VECTOR_GENERATOR_H

#include <string>
#include <vector>

#include "../codec/Codec.h"
#include "Fixture.h"
#include "VectorSpecs.hpp"

namespace rqharness {

struct GeneratedVector {
  Fixture fixture;
  // K of the first source block
  uint32_t n_source_symbols = 0;
};

// Deterministic: the same VectorSpec and codec always give the same fixture
GeneratedVector generate_vector(const Codec &codec, const VectorSpec &spec);

// Generate @param spec and write it to output_dir/spec.filename.
// Returns the path written. Throws FixtureIOError on failure.
std::string write_vector(const Codec &codec, const VectorSpec &spec,
                         const std::string &output_dir);

struct VectorCheckResult {
  std::string path;
  bool decodes = false;
  // file content is byte-identical to a fresh regeneration
  bool identical_to_regeneration = false;
  // why the fixture could not be read, empty otherwise
  std::string error;
  bool ok() const { return decodes && identical_to_regeneration; }
};
// Read back output_dir/spec.filename, decode it and compare it with a fresh
// regeneration
VectorCheckResult check_vector(const Codec &codec, const VectorSpec &spec,
                               const std::string &output_dir);

}  // namespace rqharness

#endif  // RQHARNESS_VECTOR_GENERATOR_H
