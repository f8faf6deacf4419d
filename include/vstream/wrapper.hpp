#pragma once

#include <string>
#include <vector>
#include <VMUtils/attributes.hpp>
#include <VMUtils/nonnull.hpp>
#include <vstream/composite_stream.hpp>
#include <vstream/utils/buffer_stream.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

VM_EXPORT
{
	/* what a wrapper needs to open a stream, the counterpart of a stream context */
	struct StreamContext
	{
		VM_DEFINE_ATTRIBUTE( vm::Arc<vector<Source>>, data );
		VM_DEFINE_ATTRIBUTE( vm::Arc<string>, buffer );
	};

	/*
	  Every get_stream() call takes the next id of the wrapper's scheme, so
	  uris look like "<name>://1", "<name>://2", ... for the life of the process.
	*/
	struct CombineWrapper
	{
		static constexpr char const *name = "vstream-wrapper-combine";

		static vm::Arc<CompositeStream> get_stream( vector<Source> data,
													CompositeStreamOptions opts = {} );
		/* throws MisuseError unless uri is in this scheme and ctx carries data */
		static vm::Arc<CompositeStream> open( string const &uri, StreamContext const &ctx,
											  CompositeStreamOptions opts = {} );
	};

	struct StringWrapper
	{
		static constexpr char const *name = "vstream-wrapper-string";

		static vm::Arc<BufferStream> get_stream( vm::Arc<string> buffer );
		static vm::Arc<BufferStream> open( string const &uri, StreamContext const &ctx );
	};
}

VM_END_MODULE()
