#pragma once

#include <memory>
#include <string>
#include <VMUtils/nonnull.hpp>
#include <vstream/io.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

VM_EXPORT
{
	/*
	  Stream over a byte buffer shared with the caller. Writes go straight into
	  the shared buffer, so every holder of `buffer` observes them.
	*/
	struct BufferStream : Stream
	{
		BufferStream( vm::Arc<string> buffer = make_shared<string>() ) :
		  buffer( std::move( buffer ) )
		{
		}

		size_t read( char *dst, size_t len ) override
		{
			if ( !buffer ) return 0;
			auto nread = std::min( len, p < buffer->size() ? buffer->size() - p : 0 );
			if ( nread ) {
				memcpy( dst, buffer->data() + p, nread );
			}
			p += nread;
			if ( nread < len ) {
				ateof = true;
			}
			return nread;
		}
		size_t write( char const *src, size_t len ) override
		{
			if ( !buffer ) {
				throw IoError( "write to a closed buffer stream" );
			}
			if ( !len ) return 0;
			if ( buffer->size() < p + len ) {
				buffer->resize( p + len );
			}
			memcpy( &( *buffer )[ p ], src, len );
			p += len;
			return len;
		}
		bool seek( int64_t offset, int whence = SEEK_SET ) override
		{
			if ( !buffer ) return false;
			int64_t pos;
			switch ( whence ) {
			case SEEK_SET: pos = offset; break;
			case SEEK_CUR: pos = seek_target( int64_t( p ), offset ); break;
			case SEEK_END: pos = seek_target( int64_t( buffer->size() ), offset ); break;
			default: return false;
			}
			if ( pos < 0 || pos > int64_t( buffer->size() ) ) {
				return false;
			}
			p = pos;
			ateof = false;
			return true;
		}
		size_t tell() const override { return p; }
		bool eof() const override { return ateof; }
		Stat stat() const override
		{
			return Stat{}.set_size( buffer ? buffer->size() : 0 );
		}
		bool is_open() const override { return buffer != nullptr; }
		/* drops this stream's reference, the caller's buffer is left intact */
		void close() override
		{
			buffer.reset();
			p = 0;
			ateof = false;
		}

		vm::Arc<string> const &data() const { return buffer; }

	private:
		vm::Arc<string> buffer;
		size_t p = 0;
		bool ateof = false;
	};
}

VM_END_MODULE()
