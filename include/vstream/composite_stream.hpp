#pragma once

#include <string>
#include <vector>
#include <VMUtils/attributes.hpp>
#include <VMUtils/concepts.hpp>
#include <VMUtils/nonnull.hpp>
#include <vstream/io.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

struct CompositeStreamImpl;

VM_EXPORT
{
	enum class SourceKind : uint32_t
	{
		Bytes,
		Stream
	};

	/*
	  One data source of a composite stream: either raw bytes, which the
	  composite copies into a backing stream it owns, or a caller-supplied
	  stream, which it shares and never closes.
	*/
	struct Source
	{
		static Source bytes( string data )
		{
			Source src;
			src.kind = SourceKind::Bytes;
			src.data = std::move( data );
			return src;
		}
		static Source stream( vm::Arc<Stream> handle )
		{
			Source src;
			src.kind = SourceKind::Stream;
			src.handle = std::move( handle );
			return src;
		}

	public:
		SourceKind kind = SourceKind::Bytes;
		string data;
		vm::Arc<Stream> handle;
	};

	struct CompositeStreamOptions
	{
		VM_DEFINE_ATTRIBUTE( string, uri ) = "composite";
		/* report degraded operations to stderr */
		VM_DEFINE_ATTRIBUTE( bool, verbose ) = false;
	};

	/*
	  Presents an ordered list of sources as one contiguous stream.

	  read() spans segments and latches eof() only when a request runs past
	  the last byte. write() stays inside the active segment and grows it when
	  the data runs past its end. seek() clamps to size(), clears the eof latch
	  and returns whether the position moved. A negative target clears the
	  latch but leaves the position; an unknown whence touches nothing.
	*/
	struct CompositeStream final : Stream, vm::NoCopy, vm::NoMove
	{
		CompositeStream( vector<Source> const &data, CompositeStreamOptions const &opts = {} );
		~CompositeStream();

		size_t read( char *dst, size_t len ) override;
		size_t write( char const *src, size_t len ) override;
		bool seek( int64_t offset, int whence = SEEK_SET ) override;
		size_t tell() const override;
		bool eof() const override;
		Stat stat() const override;
		bool is_open() const override;
		void close() override;

		string const &uri() const;

	private:
		vm::Box<CompositeStreamImpl> _;
	};
}

VM_END_MODULE()
