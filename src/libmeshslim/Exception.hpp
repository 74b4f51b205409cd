#ifndef _libmeshslim_Exception_h_
#define _libmeshslim_Exception_h_

#include <stdexcept>

namespace MeshSlim {

// Base for MeshSlim's own exceptions.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define MESHSLIM_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
// Critical exception, the operation cannot continue.
MESHSLIM_DERIVE_EXCEPTION(CriticalException,  Exception);
MESHSLIM_DERIVE_EXCEPTION(RuntimeError,       CriticalException);
MESHSLIM_DERIVE_EXCEPTION(LogicError,         CriticalException);
MESHSLIM_DERIVE_EXCEPTION(InvalidArgument,    LogicError);
// Mesh violating the indexed mesh contract: index count not a multiple of 3,
// or an index pointing past the vertex array.
MESHSLIM_DERIVE_EXCEPTION(InvalidMeshError,   InvalidArgument);
#undef MESHSLIM_DERIVE_EXCEPTION

} // namespace MeshSlim

#endif // _libmeshslim_Exception_h_
