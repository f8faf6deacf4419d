#include <limits>
#include <sstream>
#include <gtest/gtest.h>
#include <vstream/composite_stream.hpp>

using namespace vstream;
using namespace std;

TEST( test_io, copy )
{
	string big( 10000, 'x' );
	CompositeStream stream( { Source::bytes( "head:" ), Source::bytes( big ), Source::bytes( ":tail" ) } );
	ostringstream os;
	EXPECT_EQ( big.length() + 10, Copy().transfer( stream, os ) );
	EXPECT_EQ( "head:" + big + ":tail", os.str() );
	EXPECT_TRUE( stream.eof() );
}

TEST( test_io, copy_limit )
{
	CompositeStream stream( { Source::bytes( "123456789" ), Source::bytes( "abcdef" ) } );
	EXPECT_TRUE( stream.seek( 7, SEEK_SET ) );
	ostringstream os;
	EXPECT_EQ( 4, Copy( 4 ).transfer( stream, os ) );
	EXPECT_EQ( "89ab", os.str() );
	EXPECT_FALSE( stream.eof() );
}

TEST( test_io, copy_to_failed_stream )
{
	CompositeStream stream( { Source::bytes( "abc" ) } );
	ostringstream os;
	os.setstate( ios::badbit );
	EXPECT_THROW( Copy().transfer( stream, os ), IoError );
}

TEST( test_io, stat_print )
{
	ostringstream os;
	os << Stat{}.set_size( 42 );
	auto text = os.str();
	EXPECT_NE( string::npos, text.find( "size: 42" ) );
	EXPECT_NE( string::npos, text.find( "blocks: 0" ) );
}

TEST( test_io, seek_target )
{
	auto huge = numeric_limits<int64_t>::max();
	EXPECT_EQ( 12, seek_target( 8, 4 ) );
	EXPECT_EQ( -1, seek_target( 3, -4 ) );
	EXPECT_EQ( huge, seek_target( 8, huge ) );
	EXPECT_EQ( huge, seek_target( huge, 1 ) );
	EXPECT_EQ( 0, seek_target( huge, -huge ) );
}
