// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Options.hxx"
#include "Password.hxx"
#include "Error.hxx"
#include "util/ByteSpan.hxx"
#include "KeyFixtures.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;
using namespace Avain;

TEST(Options, Defaults)
{
	const auto ctx = Context::Build({});
	EXPECT_EQ(ctx.password_source, Context::PasswordSource::NONE);
	EXPECT_TRUE(ctx.prompter);
	EXPECT_TRUE(ctx.alg.empty());
	EXPECT_TRUE(ctx.kid.empty());
	EXPECT_FALSE(ctx.subtle);
	EXPECT_FALSE(ctx.no_defaults);
	EXPECT_FALSE(ctx.verify_kid);
	EXPECT_FALSE(ctx.HasSymmetricAlgorithm());
}

TEST(Options, Overrides)
{
	const auto ctx = Context::Build({
		WithAlg("HS384"),
		WithUse("enc"),
		WithKid("foo"),
		WithSubtle(),
		WithNoDefaults(),
		WithVerifyKid(),
	});

	EXPECT_EQ(ctx.alg, "HS384"sv);
	EXPECT_EQ(ctx.use, "enc"sv);
	EXPECT_EQ(ctx.kid, "foo"sv);
	EXPECT_TRUE(ctx.subtle);
	EXPECT_TRUE(ctx.no_defaults);
	EXPECT_TRUE(ctx.verify_kid);
	EXPECT_TRUE(ctx.HasSymmetricAlgorithm());
}

TEST(Options, LastWins)
{
	const auto ctx = Context::Build({WithKid("a"), WithKid("b"), WithSubtle(), WithSubtle(false)});
	EXPECT_EQ(ctx.kid, "b"sv);
	EXPECT_FALSE(ctx.subtle);
}

TEST(Options, AsymmetricAlgorithm)
{
	EXPECT_FALSE(Context::Build({WithAlg("ES256")}).HasSymmetricAlgorithm());
}

TEST(Options, TwoPasswordSources)
{
	EXPECT_THROW(Context::Build({WithPassword("a"), WithPasswordFile("/tmp/b")}),
		     ConfigurationError);
	EXPECT_THROW(Context::Build({WithPassword("a"), WithPassword("b")}),
		     ConfigurationError);
	EXPECT_THROW(Context::Build({
				WithPasswordFile("/tmp/b"),
				WithPasswordPrompter({}, [](std::string_view){ return SecretBuffer{}; }),
			}),
		ConfigurationError);
}

TEST(Password, Literal)
{
	const auto ctx = Context::Build({WithPassword("mypassword")});
	EXPECT_EQ(ToStringView(AcquirePassword(ctx, "test")), "mypassword"sv);
}

TEST(Password, File)
{
	const TemporaryFile file{"mypassword\r\n"sv};
	const auto ctx = Context::Build({WithPasswordFile(file.GetPath())});
	const auto password = AcquirePassword(ctx, "test");

	EXPECT_EQ(ToStringView(password), "mypassword"sv);
}

TEST(Password, FileSingleNewline)
{
	const TemporaryFile file{"my password\n\n"sv};
	const auto password = ReadPasswordFile(file.GetPath().c_str());

	/* only one trailing newline is removed */
	EXPECT_EQ(ToStringView(password), "my password\n"sv);
}

TEST(Password, MissingFile)
{
	const auto ctx = Context::Build({WithPasswordFile("/nonexistent/avain/password")});

	try {
		AcquirePassword(ctx, "test");
		FAIL();
	} catch (const IOError &e) {
		EXPECT_NE(std::string_view{e.what()}.find("/nonexistent/avain/password"),
			  std::string_view::npos);
		EXPECT_EQ(e.GetSource(), "/nonexistent/avain/password"sv);
	}
}

TEST(Password, Prompter)
{
	std::string seen_prompt;
	const auto ctx = Context::Build({
		WithPasswordPrompter({}, [&seen_prompt](std::string_view prompt){
			seen_prompt = prompt;
			return SecretBuffer{"secret"sv};
		}),
	});

	EXPECT_EQ(ToStringView(AcquirePassword(ctx, "keys.json")), "secret"sv);
	EXPECT_EQ(seen_prompt, "Please enter the password to decrypt keys.json"sv);
}

TEST(Password, CustomPrompt)
{
	std::string seen_prompt;
	const auto ctx = Context::Build({
		WithPasswordPrompter("Key password", [&seen_prompt](std::string_view prompt){
			seen_prompt = prompt;
			return SecretBuffer{"secret"sv};
		}),
	});

	AcquirePassword(ctx, "keys.json");
	EXPECT_EQ(seen_prompt, "Key password"sv);
}

TEST(Password, PrompterFailure)
{
	const auto ctx = Context::Build({
		WithPasswordPrompter({}, [](std::string_view) -> SecretBuffer {
			throw std::runtime_error{"no terminal"};
		}),
	});

	EXPECT_THROW(AcquirePassword(ctx, "keys.json"), IOError);
}
