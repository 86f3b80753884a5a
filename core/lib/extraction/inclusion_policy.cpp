// typegraph/extraction/inclusion_policy.cpp
#include "typegraph/extraction/inclusion_policy.hpp"

namespace typegraph
{

bool is_included(const Symbol & symbol, const ExtractionOptions & options) noexcept
{
  if (symbol.is_implicitly_declared && !options.include_compiler_generated) {
    return false;
  }

  switch (symbol.accessibility) {
    case Accessibility::Private:
      return options.include_private;
    case Accessibility::Internal:
    case Accessibility::ProtectedAndInternal:
      return options.include_internal;
    case Accessibility::NotApplicable:
    case Accessibility::Protected:
    case Accessibility::ProtectedOrInternal:
    case Accessibility::Public:
      break;
  }
  return true;
}

}  // namespace typegraph
