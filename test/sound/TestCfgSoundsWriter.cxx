// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "sound/CfgSoundsWriter.hxx"
#include "io/StringOutputStream.hxx"

#include <gtest/gtest.h>

TEST(CfgSoundsWriter, Empty)
{
	StringOutputStream os;
	CfgSoundsWriter writer(os, "sounds", 1.0);
	writer.Begin("CfgSounds");
	writer.End();

	EXPECT_EQ(writer.GetTrackCount(), 0U);
	EXPECT_EQ(os.GetValue(),
		  "class CfgSounds\n"
		  "{\n"
		  "    tracks[]={};\n"
		  "};\n");
}

TEST(CfgSoundsWriter, Tracks)
{
	StringOutputStream os;
	CfgSoundsWriter writer(os, "sounds", 1.0);
	writer.Begin("CfgSounds");
	writer.AddTrack("my song.ogg", 50.0);
	writer.AddTrack("b.ogg", 160.0 / 49.0);
	writer.End();

	EXPECT_EQ(writer.GetTrackCount(), 2U);
	EXPECT_EQ(os.GetValue(), R"(class CfgSounds
{
    tracks[]={};

    class my_song
    {
        name = "my_song";
        sound[] = {"\sounds\my song.ogg", 50.0, 1.0};
        titles[] = {};
    };

    class b
    {
        name = "b";
        sound[] = {"\sounds\b.ogg", 3.2653061224489797, 1.0};
        titles[] = {};
    };
};
)");
}

TEST(CfgSoundsWriter, Settings)
{
	StringOutputStream os;
	CfgSoundsWriter writer(os, "music", 0.25);
	writer.Begin("CfgMusic");
	writer.AddTrack("x.ogg", 2.0);
	writer.End();

	EXPECT_EQ(os.GetValue(), R"(class CfgMusic
{
    tracks[]={};

    class x
    {
        name = "x";
        sound[] = {"\music\x.ogg", 2.0, 0.25};
        titles[] = {};
    };
};
)");
}
