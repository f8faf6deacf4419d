#pragma once

#include <fstream>
#include <iostream>
#include <string>
#include <VMUtils/concepts.hpp>
#include <VMUtils/nonnull.hpp>
#include <vstream/io.hpp>

VM_BEGIN_MODULE( vstream )

using namespace std;

VM_EXPORT
{
	enum class FileMode : uint32_t
	{
		Read,
		ReadWrite,
		Truncate /* create or truncate, read & write */
	};

	/*
	  Stream over a borrowed std::iostream. The wrapper owns the position and
	  re-applies it to both get and put pointers before every transfer.
	*/
	struct StdStream : Stream
	{
		StdStream( iostream &_ ) :
		  _( &_ )
		{
		}

		size_t read( char *dst, size_t len ) override;
		size_t write( char const *src, size_t len ) override;
		bool seek( int64_t offset, int whence = SEEK_SET ) override;
		size_t tell() const override { return p; }
		bool eof() const override { return ateof; }
		Stat stat() const override;
		bool is_open() const override { return _ != nullptr; }
		void close() override;

	protected:
		StdStream() = default;
		size_t extent() const;

	protected:
		iostream *_ = nullptr;
		size_t p = 0;
		bool ateof = false;
	};

	struct FileStream final : StdStream, vm::NoCopy, vm::NoMove
	{
		FileStream( string const &path, FileMode mode = FileMode::Read );

		void close() override;

		string const &path() const { return file_path; }

	private:
		string file_path;
		vm::Box<fstream> file;
	};
}

VM_END_MODULE()
