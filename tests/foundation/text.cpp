/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <bazinga/foundation/text.hpp>
#include <gtest/gtest.h>

TEST(TextTest, ConstructorStoresNameAndContent)
{
	const bzg::Text text("greeting", "hello");

	EXPECT_EQ(text.get_name(), "greeting");
	EXPECT_EQ(text.get_content(), "hello");
	EXPECT_EQ(text.size(), 5);
	EXPECT_FALSE(text.empty());
	EXPECT_EQ(text.revision(), 0);
}

TEST(TextTest, DefaultContentIsEmpty)
{
	const bzg::Text text("blank");

	EXPECT_TRUE(text.empty());
	EXPECT_EQ(text.get_content(), "");
}

TEST(TextTest, SetContentBumpsRevision)
{
	bzg::Text text("t", "abc");

	text.set_content("xyz");
	EXPECT_EQ(text.get_content(), "xyz");
	EXPECT_EQ(text.revision(), 1);

	/* same content still counts as a rewrite */
	text.set_content("xyz");
	EXPECT_EQ(text.revision(), 2);
}
