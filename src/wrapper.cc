#include <atomic>
#include <vstream/wrapper.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

namespace
{
atomic<uint64_t> combine_id( 0 );
atomic<uint64_t> string_id( 0 );

string make_uri( char const *scheme, atomic<uint64_t> &id )
{
	return vm::fmt( "{}://{}", scheme, ++id );
}

void check_scheme( string const &uri, char const *scheme, char const *wrapper )
{
	auto prefix = vm::fmt( "{}://", scheme );
	if ( uri.compare( 0, prefix.length(), prefix ) != 0 ) {
		throw MisuseError( vm::fmt( "{} can not open {}", wrapper, uri ) );
	}
}

}  // namespace

VM_EXPORT
{
	constexpr char const *CombineWrapper::name;
	constexpr char const *StringWrapper::name;

	vm::Arc<CompositeStream> CombineWrapper::get_stream( vector<Source> data,
														 CompositeStreamOptions opts )
	{
		auto ctx = StreamContext{}
					 .set_data( make_shared<vector<Source>>( std::move( data ) ) );
		return open( make_uri( name, combine_id ), ctx, std::move( opts ) );
	}

	vm::Arc<CompositeStream> CombineWrapper::open( string const &uri, StreamContext const &ctx,
												   CompositeStreamOptions opts )
	{
		check_scheme( uri, name, "CombineWrapper" );
		if ( !ctx.data ) {
			throw MisuseError( "use CombineWrapper::get_stream() to initialize the stream" );
		}
		opts.set_uri( uri );
		return vm::Arc<CompositeStream>( new CompositeStream( *ctx.data, opts ) );
	}

	vm::Arc<BufferStream> StringWrapper::get_stream( vm::Arc<string> buffer )
	{
		auto ctx = StreamContext{}
					 .set_buffer( std::move( buffer ) );
		return open( make_uri( name, string_id ), ctx );
	}

	vm::Arc<BufferStream> StringWrapper::open( string const &uri, StreamContext const &ctx )
	{
		check_scheme( uri, name, "StringWrapper" );
		if ( !ctx.buffer ) {
			throw MisuseError( "use StringWrapper::get_stream() to initialize the stream" );
		}
		return vm::Arc<BufferStream>( new BufferStream( ctx.buffer ) );
	}
}

VM_END_MODULE()
