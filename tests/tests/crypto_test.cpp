#include <boost/test/unit_test.hpp>

#include <meshwire/crypto/elliptic.hpp>

#include <meshwire/tests/crypto_fixture.hpp>

#include <string>

BOOST_FIXTURE_TEST_SUITE( crypto_tests, crypto_fixture )

BOOST_AUTO_TEST_CASE( ripemd160_test )
{
   test( multicodec::ripemd_160, TEST1, "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc" );
   test( multicodec::ripemd_160, TEST2, "9c1185a5c5e9fc54612808977ee8f548b2258d31" );
   test( multicodec::ripemd_160, TEST3, "12a053384a9c0c88e405a06c27dcf49ada62eb2b" );
   test( multicodec::ripemd_160, TEST4, "6f3fa39b6b503c384f919a49a7aa5c2c08bdfb45" );
   test( multicodec::ripemd_160, TEST5, "52783243c1697bdbe16d37f97f68f08325dc1528" );
}

BOOST_AUTO_TEST_CASE( sha256_test )
{
   test( multicodec::sha2_256, TEST1, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" );
   test( multicodec::sha2_256, TEST2, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" );
   test( multicodec::sha2_256, TEST3, "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1" );
   test( multicodec::sha2_256, TEST4, "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1" );
   test( multicodec::sha2_256, TEST5, "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0" );
}

BOOST_AUTO_TEST_CASE( hash_errors )
{
   BOOST_REQUIRE_THROW( hash( multicodec( 0x99 ), TEST1 ), unknown_hash_algorithm );
   BOOST_REQUIRE_THROW( hash( multicodec( 0x11 ), TEST1 ), unknown_hash_algorithm );
   BOOST_REQUIRE_THROW( hash( multicodec::sha2_256, TEST1, 1024 ), multihash_size_limit_exceeded );

   auto mh = hash( multicodec::sha2_256, TEST1 );
   BOOST_REQUIRE_THROW( to_fixed_blob< 20 >( mh ), multihash_size_mismatch );
   BOOST_REQUIRE_EQUAL( meshwire::util::to_hex( to_fixed_blob< 32 >( mh ) ), meshwire::util::to_hex( mh.digest ) );
}

BOOST_AUTO_TEST_CASE( ecc )
{
   private_key nullkey;
   std::string pass = "foobar";

   for ( uint32_t i = 0; i < 100; ++i )
   {
      multihash h = hash( multicodec::sha2_256, pass );
      private_key priv = private_key::regenerate( h );
      BOOST_CHECK( nullkey != priv );
      public_key pub = priv.get_public_key();

      pass += "1";
      multihash h2 = hash( multicodec::sha2_256, pass );

      auto sig = priv.sign_compact( h2 );
      BOOST_CHECK( public_key::is_canonical( sig ) );

      auto recovered = public_key::recover( sig, h2 );
      BOOST_CHECK( recovered == pub );
      BOOST_CHECK( pub.verify( sig, h2 ) );
      BOOST_CHECK( !pub.verify( sig, h ) );
   }
}

BOOST_AUTO_TEST_CASE( public_key_serialization )
{
   auto priv = private_key::regenerate( hash( multicodec::sha2_256, std::string( "foobar" ) ) );
   auto pub = priv.get_public_key();

   auto cpk = pub.serialize();
   BOOST_CHECK( cpk[0] == 0x02 || cpk[0] == 0x03 );
   BOOST_CHECK( public_key::deserialize( cpk ) == pub );

   compressed_public_key bad = {};
   BOOST_REQUIRE_THROW( public_key::deserialize( bad ), key_serialization_error );

   public_key empty;
   BOOST_CHECK( !empty.valid() );
   BOOST_REQUIRE_THROW( empty.serialize(), key_serialization_error );
}

BOOST_AUTO_TEST_CASE( private_key_regeneration )
{
   auto h = hash( multicodec::sha2_256, std::string( "foobar" ) );
   auto key1 = private_key::regenerate( h );
   auto key2 = private_key::regenerate( h );
   BOOST_CHECK( key1 == key2 );
   BOOST_CHECK( key1.get_public_key() == key2.get_public_key() );

   BOOST_CHECK_EQUAL( meshwire::util::to_hex( key1.get_secret() ), meshwire::util::to_hex( h.digest ) );

   BOOST_REQUIRE_THROW( private_key::regenerate( hash( multicodec::ripemd_160, std::string( "foobar" ) ) ), key_manipulation_error );

   multihash zero;
   zero.id = multicodec::sha2_256;
   zero.digest.resize( 32, 0 );
   BOOST_REQUIRE_THROW( private_key::regenerate( zero ), key_manipulation_error );

   auto random1 = private_key::generate();
   auto random2 = private_key::generate();
   BOOST_CHECK( random1 != random2 );
}

BOOST_AUTO_TEST_CASE( public_address )
{
   auto priv = private_key::regenerate( hash( multicodec::sha2_256, std::string( "foobar" ) ) );
   auto pub = priv.get_public_key();
   auto cpk = pub.serialize();

   auto sha = hash( multicodec::sha2_256, cpk.data(), cpk.size() );
   auto expected = hash( multicodec::ripemd_160, sha.digest );

   auto address = pub.to_address();
   BOOST_REQUIRE_EQUAL( meshwire::util::to_hex( address ), meshwire::util::to_hex( expected.digest ) );

   auto other = private_key::regenerate( hash( multicodec::sha2_256, std::string( "barfoo" ) ) );
   BOOST_CHECK( other.get_public_key().to_address() != address );
}

BOOST_AUTO_TEST_CASE( signature_rejection )
{
   auto priv = private_key::regenerate( hash( multicodec::sha2_256, std::string( "foobar" ) ) );
   auto pub = priv.get_public_key();
   auto digest = hash( multicodec::sha2_256, std::string( "message" ) );
   auto sig = priv.sign_compact( digest );

   BOOST_TEST_MESSAGE( "Recovery id out of range" );
   auto bad_id = sig;
   bad_id[0] = 0;
   BOOST_REQUIRE_THROW( public_key::recover( bad_id, digest ), key_recovery_error );
   BOOST_CHECK( !pub.verify( bad_id, digest ) );

   BOOST_TEST_MESSAGE( "High s value" );
   auto high_s = sig;
   for ( std::size_t i = 33; i < high_s.size(); i++ )
      high_s[i] = char( 0xFF );
   BOOST_CHECK( !public_key::is_canonical( high_s ) );
   BOOST_REQUIRE_THROW( public_key::recover( high_s, digest ), key_recovery_error );
   BOOST_CHECK( !pub.verify( high_s, digest ) );

   BOOST_TEST_MESSAGE( "Digest of the wrong algorithm" );
   auto ripemd = hash( multicodec::ripemd_160, std::string( "message" ) );
   BOOST_REQUIRE_THROW( public_key::recover( sig, ripemd ), key_recovery_error );
   BOOST_REQUIRE_THROW( priv.sign_compact( ripemd ), signing_error );

   BOOST_TEST_MESSAGE( "Empty keys" );
   private_key empty;
   BOOST_REQUIRE_THROW( empty.sign_compact( digest ), signing_error );
   BOOST_CHECK( !public_key().verify( sig, digest ) );
}

BOOST_AUTO_TEST_SUITE_END()
