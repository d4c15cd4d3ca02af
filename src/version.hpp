#ifndef _version_hpp_INCLUDED
#define _version_hpp_INCLUDED

namespace Dipple {

const char * version ();
const char * copyright ();
const char * signature ();

}

#endif
