#pragma once

// Convenience header pulling in the complete tool-core API.
// Prefer including the individual headers in library code.

#include <tool-core/arrays.hh>
#include <tool-core/collection.hh>
#include <tool-core/delay.hh>
#include <tool-core/flatten.hh>
#include <tool-core/memoize.hh>
#include <tool-core/nested.hh>
#include <tool-core/objects.hh>
#include <tool-core/once.hh>
#include <tool-core/optional.hh>
#include <tool-core/reduce.hh>
#include <tool-core/zip.hh>
