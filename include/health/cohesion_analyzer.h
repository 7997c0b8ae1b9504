#pragma once

#include <health/models.h>

namespace health {

// LCOM4: connected components of the bipartite method/field usage graph.
// A struct without methods scores 0 ("not applicable"), never 1.
CohesionResult CalculateLcom4(const StructFacts &structure);

} // namespace health
