#include <gtest/gtest.h>
#include "util/url.hpp"

using namespace sg::util;

TEST(UrlTest, TargetPathDropsQueryAndFragment) {
    EXPECT_EQ(targetPath("/a/b.txt?sign=x:0#frag"), "/a/b.txt");
    EXPECT_EQ(targetPath("/a/b.txt"), "/a/b.txt");
}

TEST(UrlTest, TargetPathIsPercentDecoded) {
    EXPECT_EQ(targetPath("/a%20b.txt?sign=x"), "/a b.txt");
    EXPECT_EQ(targetPath("/%E4%B8%AD.txt"), "/\xE4\xB8\xAD.txt");
}

TEST(UrlTest, TargetPathKeepsPlusInPath) {
    EXPECT_EQ(targetPath("/a+b.txt"), "/a+b.txt");
}

TEST(UrlTest, TargetPathOfAbsoluteForm) {
    EXPECT_EQ(targetPath("http://dl.example.com/x/y?sign=1"), "/x/y");
    EXPECT_EQ(targetPath("http://dl.example.com"), "/");
}

TEST(UrlTest, EmptyTargetIsRoot) {
    EXPECT_EQ(targetPath(""), "/");
    EXPECT_EQ(targetPath("?sign=1"), "/");
}

TEST(UrlTest, QueryParamFindsFirstMatch) {
    EXPECT_EQ(queryParam("/a?x=1&sign=abc:0&sign=zzz", "sign"), "abc:0");
}

TEST(UrlTest, QueryParamKeepsPaddingInValue) {
    EXPECT_EQ(queryParam("/a?sign=jK_Mz==:9999", "sign"), "jK_Mz==:9999");
}

TEST(UrlTest, QueryParamDecodes) {
    EXPECT_EQ(queryParam("/a?sign=ab%3D%3A0", "sign"), "ab=:0");
    EXPECT_EQ(queryParam("/a?q=a+b", "q"), "a b");
}

TEST(UrlTest, QueryParamMissingIsEmpty) {
    EXPECT_EQ(queryParam("/a", "sign"), "");
    EXPECT_EQ(queryParam("/a?other=1", "sign"), "");
    EXPECT_EQ(queryParam("/a?sign", "sign"), "");
    EXPECT_EQ(queryParam("/a#sign=1", "sign"), "");
}

TEST(UrlTest, ResolveAbsoluteLocation) {
    EXPECT_EQ(resolveLocation("http://a.example/x/y", "https://b.example/z"), "https://b.example/z");
}

TEST(UrlTest, ResolveRelativeLocation) {
    EXPECT_EQ(resolveLocation("http://a.example/x/y", "/z?q=1"), "http://a.example/z?q=1");
    EXPECT_EQ(resolveLocation("http://a.example/x/y", "w"), "http://a.example/x/w");
}
