#include <limits>
#include <gtest/gtest.h>
#include <vstream/utils/buffer_stream.hpp>

using namespace vstream;
using namespace std;

TEST( test_buffer_stream, simple )
{
	auto buffer = make_shared<string>( "123456789" );
	BufferStream stream( buffer );
	EXPECT_EQ( 9, stream.size() );
	EXPECT_EQ( "1234", stream.read_string( 4 ) );
	EXPECT_EQ( 4, stream.tell() );
	EXPECT_EQ( "56789", stream.read_string( 16 ) );
	EXPECT_EQ( 9, stream.tell() );
	EXPECT_TRUE( stream.eof() );

	EXPECT_TRUE( stream.seek( 3, SEEK_SET ) );
	EXPECT_FALSE( stream.eof() );
	stream.write_string( "abcdefgh" );
	EXPECT_EQ( "123abcdefgh", *buffer );
	EXPECT_EQ( 11, stream.tell() );
	EXPECT_EQ( 11, stream.stat().size );
}

TEST( test_buffer_stream, seek_bounds )
{
	BufferStream stream( make_shared<string>( "abc" ) );
	EXPECT_TRUE( stream.seek( 0, SEEK_END ) );
	EXPECT_EQ( 3, stream.tell() );
	EXPECT_FALSE( stream.seek( 1, SEEK_END ) );
	EXPECT_FALSE( stream.seek( -4, SEEK_CUR ) );
	EXPECT_FALSE( stream.seek( 0, 7 ) );
	EXPECT_EQ( 3, stream.tell() );
	EXPECT_TRUE( stream.seek( -2, SEEK_CUR ) );
	EXPECT_EQ( "bc", stream.read_string( 2 ) );
	EXPECT_FALSE( stream.eof() );
}

TEST( test_buffer_stream, huge_offset )
{
	auto huge = numeric_limits<int64_t>::max();
	BufferStream stream( make_shared<string>( "abc" ) );
	EXPECT_TRUE( stream.seek( 1, SEEK_SET ) );
	EXPECT_FALSE( stream.seek( huge, SEEK_CUR ) );
	EXPECT_FALSE( stream.seek( huge, SEEK_END ) );
	EXPECT_EQ( 1, stream.tell() );
	EXPECT_EQ( "bc", stream.read_string( 2 ) );
}

TEST( test_buffer_stream, buffer_shrunk_by_owner )
{
	auto buffer = make_shared<string>( "123456789" );
	BufferStream stream( buffer );
	EXPECT_EQ( "12345678", stream.read_string( 8 ) );
	buffer->assign( "abc" );
	EXPECT_EQ( "", stream.read_string( 4 ) );
	EXPECT_TRUE( stream.eof() );
	EXPECT_EQ( 8, stream.tell() );
}

TEST( test_buffer_stream, closed )
{
	auto buffer = make_shared<string>( "abc" );
	BufferStream stream( buffer );
	stream.close();
	EXPECT_FALSE( stream.is_open() );
	EXPECT_EQ( "abc", *buffer );
	EXPECT_EQ( "", stream.read_string( 1 ) );
	EXPECT_FALSE( stream.seek( 0, SEEK_SET ) );
	EXPECT_EQ( 0, stream.size() );
	EXPECT_THROW( stream.write_string( "x" ), IoError );
}
