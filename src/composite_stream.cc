#include <new>
#include <vstream/composite_stream.hpp>
#include <vstream/utils/buffer_stream.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

struct Segment
{
	vm::Arc<Stream> handle;
	size_t length = 0;
	size_t cursor = 0;
	bool owned = false;
};

struct CompositeStreamImpl final : vm::NoCopy, vm::NoMove
{
	CompositeStreamImpl( vector<Source> const &data, CompositeStreamOptions const &opts ) :
	  opts( opts )
	{
		for ( auto &src : data ) {
			Segment seg;
			if ( src.kind == SourceKind::Bytes ) {
				seg.handle = materialize( src.data );
				seg.owned = true;
			} else {
				seg.handle = src.handle;
			}
			if ( !seg.handle || !seg.handle->is_open() ) {
				throw ConstructionError(
				  vm::fmt( "{}: source #{} is not an open stream", opts.uri, segments.size() ) );
			}
			seg.length = measure( *seg.handle );
			length += seg.length;
			segments.emplace_back( std::move( seg ) );
		}
		if ( opts.verbose ) {
			vm::eprintln( "{}: opened {} segments, {} bytes", opts.uri, segments.size(), length );
			for ( size_t i = 0; i != segments.size(); ++i ) {
				vm::eprintln( "{}:   #{} {} bytes ({})", opts.uri, i, segments[ i ].length,
							  segments[ i ].owned ? "materialized" : "borrowed" );
			}
		}
	}

	size_t read( char *dst, size_t count )
	{
		if ( ateof ) return 0;

		size_t nread = 0;
		while ( nread < count ) {
			size_t want = 0, got = 0;
			if ( idx < segments.size() ) {
				auto &seg = segments[ idx ];
				if ( !seg.handle->is_open() ) {
					trace( "segment #{} is closed, read of {} bytes aborted", idx, count );
					return 0;
				}
				want = std::min( count - nread, seg.cursor < seg.length ? seg.length - seg.cursor : 0 );
				if ( want ) {
					got = seg.handle->read( dst + nread, want );
				}
				seg.cursor += got;
			}
			nread += got;
			pos += got;

			if ( got < want ) {
				trace( "segment #{} gave {} of {} bytes, read aborted", idx, got, want );
				return 0;
			}
			if ( pos == length ) {
				// eof latches only on an attempt to read past the end
				if ( nread < count ) {
					ateof = true;
				}
				break;
			}
			if ( nread < count ) {
				if ( ++idx >= segments.size() ) {
					trace( "position {} < size {} past the last segment, read aborted", pos, length );
					return 0;
				}
				auto &next = segments[ idx ];
				next.handle->rewind();
				next.cursor = 0;
			}
		}
		return nread;
	}

	size_t write( char const *src, size_t len )
	{
		if ( idx >= segments.size() ) {
			trace( "no segment to write {} bytes into", len );
			return 0;
		}
		auto &seg = segments[ idx ];
		if ( !seg.handle->is_open() ) {
			trace( "segment #{} is closed, write of {} bytes rejected", idx, len );
			return 0;
		}

		auto old_length = seg.length;
		size_t nwrite;
		try {
			nwrite = seg.handle->write( src, len );
		} catch ( IoError &e ) {
			trace( "segment #{} rejected write: {}", idx, e.what() );
			return 0;
		}

		seg.cursor = seg.handle->tell();
		if ( seg.cursor > old_length ) {
			seg.length = seg.cursor;
			length += seg.length - old_length;
		}
		pos = offset_of( idx ) + seg.cursor;
		return nwrite;
	}

	bool seek( int64_t offset, int whence )
	{
		int64_t target;
		switch ( whence ) {
		case SEEK_SET: target = offset; break;
		case SEEK_CUR: target = seek_target( int64_t( pos ), offset ); break;
		case SEEK_END: target = seek_target( int64_t( length ), offset ); break;
		default:
			trace( "unsupported whence {}", whence );
			return false;
		}
		// any seek with a known whence clears the latch, even a rejected one
		ateof = false;
		if ( target < 0 ) {
			trace( "seek to negative offset {}", target );
			return false;
		}

		auto old_pos = pos;
		pos = std::min( size_t( target ), length );

		auto remain = pos;
		for ( size_t i = 0; i != segments.size(); ++i ) {
			if ( remain < segments[ i ].length ) {
				place( i, remain );
				return old_pos != pos;
			}
			remain -= segments[ i ].length;
		}
		// pos == length: park on the end of the last segment
		if ( !segments.empty() ) {
			place( segments.size() - 1, segments.back().length );
		} else {
			idx = 0;
		}
		return old_pos != pos;
	}

	Stat stat() const
	{
		return Stat{}.set_size( length );
	}

	void close()
	{
		for ( auto &seg : segments ) {
			if ( seg.owned && seg.handle->is_open() ) {
				seg.handle->close();
			}
		}
		segments.clear();
		length = pos = idx = 0;
		ateof = false;
		closed = true;
	}

private:
	static vm::Arc<Stream> materialize( string const &bytes )
	{
		try {
			vm::Arc<Stream> handle( new BufferStream );
			handle->write( bytes.data(), bytes.size() );
			return handle;
		} catch ( std::bad_alloc &e ) {
			throw ConstructionError(
			  vm::fmt( "failed to allocate a {} byte backing stream: {}", bytes.size(), e.what() ) );
		}
	}

	size_t measure( Stream &handle ) const
	{
		// a composite answers false when it already sits at its end
		if ( !handle.seek( 0, SEEK_END ) && handle.tell() != handle.size() ) {
			throw ConstructionError( vm::fmt( "{}: source #{} is not seekable", opts.uri, segments.size() ) );
		}
		auto len = handle.tell();
		handle.rewind();
		return len;
	}

	void place( size_t i, size_t cursor )
	{
		idx = i;
		segments[ i ].cursor = cursor;
		segments[ i ].handle->seek( int64_t( cursor ), SEEK_SET );
	}

	size_t offset_of( size_t i ) const
	{
		size_t off = 0;
		for ( size_t j = 0; j != i; ++j ) {
			off += segments[ j ].length;
		}
		return off;
	}

	template <typename... Args>
	void trace( char const *fmt, Args &&... args ) const
	{
		if ( opts.verbose ) {
			vm::eprintln( "{}: {}", opts.uri, vm::fmt( fmt, std::forward<Args>( args )... ) );
		}
	}

public:
	CompositeStreamOptions opts;
	vector<Segment> segments;
	size_t length = 0;
	size_t pos = 0;
	size_t idx = 0;
	bool ateof = false;
	bool closed = false;
};

VM_EXPORT
{
	CompositeStream::CompositeStream( vector<Source> const &data, CompositeStreamOptions const &opts ) :
	  _( new CompositeStreamImpl( data, opts ) )
	{
	}

	CompositeStream::~CompositeStream()
	{
		_->close();
	}

	size_t CompositeStream::read( char *dst, size_t len )
	{
		return _->read( dst, len );
	}

	size_t CompositeStream::write( char const *src, size_t len )
	{
		return _->write( src, len );
	}

	bool CompositeStream::seek( int64_t offset, int whence )
	{
		return _->seek( offset, whence );
	}

	size_t CompositeStream::tell() const
	{
		return _->pos;
	}

	bool CompositeStream::eof() const
	{
		return _->ateof;
	}

	Stat CompositeStream::stat() const
	{
		return _->stat();
	}

	bool CompositeStream::is_open() const
	{
		return !_->closed;
	}

	void CompositeStream::close()
	{
		_->close();
	}

	string const &CompositeStream::uri() const
	{
		return _->opts.uri;
	}
}

VM_END_MODULE()
