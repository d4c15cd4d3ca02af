#include "internal.hpp"

namespace Dipple {

Internal::Internal () :
  internal (this), level (0), prefix ("c "), opts (this)
{
  lim.report = lim.delta = opts.reportint;
}

}
