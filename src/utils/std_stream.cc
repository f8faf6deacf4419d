#include <vstream/utils/std_stream.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

namespace
{
ios::openmode to_openmode( FileMode mode )
{
	switch ( mode ) {
	case FileMode::Read: return ios::in | ios::binary;
	case FileMode::ReadWrite: return ios::in | ios::out | ios::binary;
	case FileMode::Truncate: return ios::in | ios::out | ios::trunc | ios::binary;
	}
	throw std::logic_error( "unknown file mode" );
}

}  // namespace

VM_EXPORT
{
	size_t StdStream::read( char *dst, size_t len )
	{
		if ( !_ ) return 0;
		_->clear();
		if ( !_->seekg( p ) ) {
			ateof = true;
			_->clear();
			return 0;
		}
		size_t nread = _->read( dst, len ).gcount();
		_->clear();
		p += nread;
		if ( nread < len ) {
			ateof = true;
		}
		return nread;
	}

	size_t StdStream::write( char const *src, size_t len )
	{
		if ( !_ ) {
			throw IoError( "write to a closed stream" );
		}
		_->clear();
		if ( !_->seekp( p ) || !_->write( src, len ) ) {
			_->clear();
			throw IoError( vm::fmt( "failed to write {} bytes at offset {}", len, p ) );
		}
		p += len;
		return len;
	}

	bool StdStream::seek( int64_t offset, int whence )
	{
		if ( !_ ) return false;
		int64_t pos;
		switch ( whence ) {
		case SEEK_SET: pos = offset; break;
		case SEEK_CUR: pos = seek_target( int64_t( p ), offset ); break;
		case SEEK_END: pos = seek_target( int64_t( extent() ), offset ); break;
		default: return false;
		}
		if ( pos < 0 ) {
			return false;
		}
		p = pos;
		ateof = false;
		return true;
	}

	Stat StdStream::stat() const
	{
		return Stat{}.set_size( _ ? extent() : 0 );
	}

	void StdStream::close()
	{
		_ = nullptr;
		p = 0;
		ateof = false;
	}

	size_t StdStream::extent() const
	{
		_->clear();
		_->flush();
		streamoff end = _->seekg( 0, ios::end ).tellg();
		_->clear();
		return end < 0 ? 0 : size_t( end );
	}

	FileStream::FileStream( string const &path, FileMode mode ) :
	  file_path( path ),
	  file( new fstream( path, to_openmode( mode ) ) )
	{
		if ( !file->is_open() ) {
			throw ConstructionError( vm::fmt( "can not open file {}", path ) );
		}
		_ = file.get();
	}

	void FileStream::close()
	{
		if ( file->is_open() ) {
			file->close();
		}
		StdStream::close();
	}
}

VM_END_MODULE()
