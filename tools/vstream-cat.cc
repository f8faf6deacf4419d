#include <fstream>
#include <iostream>
#include <string>
#include <VMUtils/cmdline.hpp>
#include <vstream/wrapper.hpp>
#include <vstream/utils/std_stream.hpp>

using namespace std;
using namespace vstream;

int main( int argc, char **argv )
{
	cmdline::parser a;
	a.add<string>( "of", 'o', "output filename, stdout if omitted", false, "" );
	a.add<long>( "seek", 's', "offset to seek to before copying", false, 0 );
	a.add<string>( "whence", 'w', "seek origin: set/cur/end", false, "set", cmdline::oneof<string>( "set", "cur", "end" ) );
	a.add<size_t>( "count", 'n', "maximum bytes to copy, 0 for all", false, 0 );
	a.add( "stat", '\0', "print stream metadata instead of content" );
	a.add( "verbose", 'v', "report segment table and degraded operations" );
	a.footer( "source ...  (file path, or text:<literal>)" );

	a.parse_check( argc, argv );

	auto output = a.get<string>( "of" );
	auto offset = a.get<long>( "seek" );
	auto origin = a.get<string>( "whence" );
	auto count = a.get<size_t>( "count" );
	auto verbose = a.exist( "verbose" );

	try {
		vector<Source> sources;
		for ( auto &arg : a.rest() ) {
			if ( arg.compare( 0, 5, "text:" ) == 0 ) {
				sources.emplace_back( Source::bytes( arg.substr( 5 ) ) );
			} else {
				sources.emplace_back( Source::stream( vm::Arc<Stream>( new FileStream( arg ) ) ) );
			}
		}

		auto stream = CombineWrapper::get_stream( sources,
												  CompositeStreamOptions{}
													.set_verbose( verbose ) );

		if ( offset != 0 || origin != "set" ) {
			auto whence = origin == "end" ? SEEK_END : origin == "cur" ? SEEK_CUR : SEEK_SET;
			auto base = whence == SEEK_END ? stream->size() : stream->tell();
			if ( seek_target( int64_t( base ), offset ) < 0 ) {
				throw runtime_error( vm::fmt( "can not seek {} from {}: negative position", offset, origin ) );
			}
			if ( !stream->seek( offset, whence ) && verbose ) {
				vm::eprintln( "seek {} from {} left position at {}", offset, origin, stream->tell() );
			}
		}

		if ( a.exist( "stat" ) ) {
			vm::println( "{}", stream->stat() );
			return 0;
		}

		Copy copy( count ? count : numeric_limits<size_t>::max() );
		size_t nbytes;
		if ( output.empty() ) {
			nbytes = copy.transfer( *stream, cout );
			cout.flush();
		} else {
			ofstream out( output, ios::binary );
			if ( !out.is_open() ) {
				throw runtime_error( vm::fmt( "can not open output file {}", output ) );
			}
			nbytes = copy.transfer( *stream, out );
			vm::println( "{} bytes written to {}", nbytes, output );
		}
		if ( verbose ) {
			vm::eprintln( "{}: copied {} of {} bytes", stream->uri(), nbytes, stream->size() );
		}
	} catch ( exception &e ) {
		vm::eprintln( "{}", e.what() );
		return 1;
	}
}
