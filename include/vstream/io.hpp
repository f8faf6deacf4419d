#pragma once

#include <cstdio>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <ostream>
#include <algorithm>

#include <VMUtils/fmt.hpp>
#include <VMUtils/concepts.hpp>
#include <VMUtils/attributes.hpp>
#include <VMUtils/modules.hpp>
#include <vstream/error.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

VM_EXPORT
{
	/* base + offset for a seek, saturated at the int64_t maximum; base >= 0 */
	inline int64_t seek_target( int64_t base, int64_t offset )
	{
		if ( offset > 0 && offset > numeric_limits<int64_t>::max() - base ) {
			return numeric_limits<int64_t>::max();
		}
		return base + offset;
	}

	struct Stat
	{
		VM_DEFINE_ATTRIBUTE( uint64_t, dev ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, ino ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, mode ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, nlink ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, uid ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, gid ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, rdev ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, size ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, atime ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, mtime ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, ctime ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, blksize ) = 0;
		VM_DEFINE_ATTRIBUTE( uint64_t, blocks ) = 0;

		friend ostream &operator<<( ostream &os, Stat const &_ )
		{
			vm::fprint( os, "dev: {}\nino: {}\nmode: {}\nnlink: {}\nuid: {}\ngid: {}\n"
							"rdev: {}\nsize: {}\natime: {}\nmtime: {}\nctime: {}\n"
							"blksize: {}\nblocks: {}",
						_.dev, _.ino, _.mode, _.nlink, _.uid, _.gid,
						_.rdev, _.size, _.atime, _.mtime, _.ctime,
						_.blksize, _.blocks );
			return os;
		}
	};

	/*
	  Generic stream handle. seek() takes SEEK_SET / SEEK_CUR / SEEK_END and
	  rejects anything else by returning false.
	*/
	struct Stream : vm::Dynamic
	{
		virtual size_t read( char *dst, size_t len ) = 0;
		/* throws IoError when nothing could be stored */
		virtual size_t write( char const *src, size_t len ) = 0;
		virtual bool seek( int64_t offset, int whence = SEEK_SET ) = 0;
		virtual size_t tell() const = 0;
		virtual bool eof() const = 0;
		virtual Stat stat() const = 0;
		virtual bool is_open() const = 0;
		virtual void close() = 0;

		size_t size() const { return stat().size; }
		void rewind() { seek( 0, SEEK_SET ); }

		string read_string( size_t len )
		{
			string buf( len, '\0' );
			buf.resize( read( &buf[ 0 ], len ) );
			return buf;
		}
		size_t write_string( string const &src )
		{
			return write( src.data(), src.length() );
		}
	};

	struct Pipe : vm::Dynamic
	{
		virtual size_t transfer( Stream &src, ostream &dst ) = 0;
	};

	struct Copy : Pipe
	{
		Copy( size_t limit = numeric_limits<size_t>::max() ) :
		  limit( limit )
		{
		}

		size_t transfer( Stream &src, ostream &dst ) override
		{
			char _[ 4096 ];
			size_t total = 0;
			while ( total < limit ) {
				auto nread = src.read( _, std::min( sizeof( _ ), limit - total ) );
				if ( !nread ) {
					break;
				}
				if ( !dst.write( _, nread ) ) {
					throw IoError( vm::fmt( "failed to transfer {} bytes at offset {}", nread, total ) );
				}
				total += nread;
			}
			return total;
		}

	private:
		size_t limit;
	};
}

VM_END_MODULE()
