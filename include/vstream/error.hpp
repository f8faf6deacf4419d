#pragma once

#include <stdexcept>
#include <string>

#include <VMUtils/modules.hpp>

VM_BEGIN_MODULE( vstream )

VM_EXPORT
{
	/* a source could not be materialized or measured while opening a stream */
	struct ConstructionError : std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	/* a stream was opened without going through its wrapper */
	struct MisuseError : std::logic_error
	{
		using std::logic_error::logic_error;
	};

	/* raised by stream handles when a write cannot be stored */
	struct IoError : std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};
}

VM_END_MODULE()
