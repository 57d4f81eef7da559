#include "toastkit/ui/MonospaceFont.hh"
#include "toastkit/ui/ToastFactory.hh"
#include "toastkit/ui/ToastSettings.hh"
#include "toastkit/utils/ErrorHandling.hh"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace toastkit {

class ToastFactoryTest : public ::testing::Test {
  protected:
    std::shared_ptr<const Font> font_ = std::make_shared<MonospaceFont>(10.0f, 20.0f, 20.0f);
    ViewportSize viewport_{800.0f, 600.0f};
    int queries_ = 0;

    ViewportQuery query() {
        return [this] {
            ++queries_;
            return viewport_;
        };
    }

    static std::string messageOf(const std::function<void()>& action) {
        try {
            action();
        } catch (const ToastkitException& e) {
            return e.what();
        }
        return {};
    }
};

// -- Builder --

TEST_F(ToastFactoryTest, DefaultsAfterBuild) {
    auto factory = ToastFactory::Builder(query()).font(font_).build();

    EXPECT_EQ(factory.font(), font_);
    EXPECT_EQ(factory.backgroundColor(), colors::kToastGray);
    EXPECT_EQ(factory.fontColor(), colors::kWhite);
    EXPECT_FLOAT_EQ(factory.positionY(), 100.0f + (600.0f - 100.0f) / 10.0f);
    EXPECT_FLOAT_EQ(factory.fadingDuration(), 0.5f);
    EXPECT_FLOAT_EQ(factory.maxTextRelativeWidth(), 0.65f);
    EXPECT_FALSE(factory.customMargin().has_value());
}

TEST_F(ToastFactoryTest, SettersOverrideDefaults) {
    auto factory = ToastFactory::Builder(query())
                       .font(font_)
                       .backgroundColor(colors::kBlack)
                       .fontColor(Color(1.0f, 0.0f, 0.0f))
                       .positionY(42.0f)
                       .fadingDuration(1.25f)
                       .maxTextRelativeWidth(0.4f)
                       .margin(6)
                       .build();

    EXPECT_EQ(factory.backgroundColor(), colors::kBlack);
    EXPECT_EQ(factory.fontColor(), Color(1.0f, 0.0f, 0.0f));
    EXPECT_FLOAT_EQ(factory.positionY(), 42.0f);
    EXPECT_FLOAT_EQ(factory.fadingDuration(), 1.25f);
    EXPECT_FLOAT_EQ(factory.maxTextRelativeWidth(), 0.4f);
    EXPECT_EQ(factory.customMargin(), 6);
}

TEST_F(ToastFactoryTest, BackgroundAlphaIsIgnored) {
    auto factory = ToastFactory::Builder(query()).font(font_).backgroundColor(colors::kBlack.withAlpha(0.3f)).build();
    EXPECT_EQ(factory.backgroundColor(), colors::kBlack);
}

TEST_F(ToastFactoryTest, ZeroFadingDurationIsAccepted) {
    auto factory = ToastFactory::Builder(query()).font(font_).fadingDuration(0.0f).build();
    EXPECT_FLOAT_EQ(factory.fadingDuration(), 0.0f);
}

TEST_F(ToastFactoryTest, NegativeFadingDurationThrows) {
    ToastFactory::Builder builder(query());
    EXPECT_EQ(messageOf([&] { builder.fadingDuration(-0.1f); }), "Duration must be non-negative number");
    // A rejected value leaves the builder usable
    EXPECT_NO_THROW(builder.font(font_).build());
}

TEST_F(ToastFactoryTest, BuildWithoutFontThrows) {
    ToastFactory::Builder builder(query());
    EXPECT_EQ(messageOf([&] { builder.build(); }), "Font is not set");
}

TEST_F(ToastFactoryTest, BuilderIsSingleUse) {
    ToastFactory::Builder builder(query());
    builder.font(font_).build();

    const std::string used = "Builder can be used only once";
    EXPECT_EQ(messageOf([&] { builder.build(); }), used);
    EXPECT_EQ(messageOf([&] { builder.font(font_); }), used);
    EXPECT_EQ(messageOf([&] { builder.backgroundColor(colors::kBlack); }), used);
    EXPECT_EQ(messageOf([&] { builder.fontColor(colors::kBlack); }), used);
    EXPECT_EQ(messageOf([&] { builder.positionY(1.0f); }), used);
    EXPECT_EQ(messageOf([&] { builder.fadingDuration(1.0f); }), used);
    EXPECT_EQ(messageOf([&] { builder.fadingDuration(-1.0f); }), used);
    EXPECT_EQ(messageOf([&] { builder.maxTextRelativeWidth(0.5f); }), used);
    EXPECT_EQ(messageOf([&] { builder.margin(3); }), used);
    EXPECT_EQ(messageOf([&] { builder.settings(ToastSettings{}); }), used);
}

TEST_F(ToastFactoryTest, EmptyViewportQueryThrows) {
    EXPECT_THROW(ToastFactory::Builder(ViewportQuery{}), ToastkitException);
}

TEST_F(ToastFactoryTest, SettingsApplyOnlyPresentFields) {
    ToastSettings settings;
    settings.fadingDuration = 2.0f;
    settings.margin = 8;

    auto factory = ToastFactory::Builder(query()).font(font_).positionY(10.0f).settings(settings).build();

    EXPECT_FLOAT_EQ(factory.fadingDuration(), 2.0f);
    EXPECT_EQ(factory.customMargin(), 8);
    EXPECT_FLOAT_EQ(factory.positionY(), 10.0f);
    EXPECT_FLOAT_EQ(factory.maxTextRelativeWidth(), 0.65f);
    EXPECT_EQ(factory.backgroundColor(), colors::kToastGray);
}

TEST_F(ToastFactoryTest, NegativeFadingInSettingsThrows) {
    ToastSettings settings;
    settings.fadingDuration = -1.0f;
    ToastFactory::Builder builder(query());
    EXPECT_THROW(builder.settings(settings), ToastkitException);
}

// -- create --

TEST_F(ToastFactoryTest, CreateAppliesConfiguration) {
    auto factory = ToastFactory::Builder(query()).font(font_).positionY(75.0f).fadingDuration(0.3f).margin(5).build();

    Toast toast = factory.create("abc", ToastLength::Long);
    EXPECT_EQ(toast.message(), "abc");
    EXPECT_FLOAT_EQ(toast.timeToLive(), 3.5f);
    EXPECT_FLOAT_EQ(toast.fadingDuration(), 0.3f);
    EXPECT_FLOAT_EQ(toast.geometry().positionY, 75.0f);
    EXPECT_EQ(toast.geometry().margin, 5);
    EXPECT_FLOAT_EQ(toast.geometry().positionX, 400.0f - static_cast<float>(toast.geometry().toastWidth / 2));
}

TEST_F(ToastFactoryTest, CreateCanBeCalledRepeatedly) {
    auto factory = ToastFactory::Builder(query()).font(font_).build();
    Toast a = factory.create("one", ToastLength::Short);
    Toast b = factory.create("two", ToastLength::Long);
    EXPECT_EQ(a.message(), "one");
    EXPECT_EQ(b.message(), "two");
    EXPECT_FLOAT_EQ(a.timeToLive(), 2.0f);
    EXPECT_FLOAT_EQ(b.timeToLive(), 3.5f);
}

TEST_F(ToastFactoryTest, CreateFollowsViewportResize) {
    auto factory = ToastFactory::Builder(query()).font(font_).build();
    int before = queries_;

    Toast wide = factory.create("abc", ToastLength::Short);
    viewport_.width = 400.0f;
    Toast narrow = factory.create("abc", ToastLength::Short);

    EXPECT_EQ(queries_, before + 2);
    EXPECT_FLOAT_EQ(wide.geometry().positionX, 400.0f - 55.0f);
    EXPECT_FLOAT_EQ(narrow.geometry().positionX, 200.0f - 55.0f);
}

TEST_F(ToastFactoryTest, BuiltFactoryIsCopyable) {
    auto factory = ToastFactory::Builder(query()).font(font_).margin(3).build();
    ToastFactory copy = factory;
    EXPECT_EQ(copy.customMargin(), 3);
    EXPECT_EQ(copy.create("x", ToastLength::Short).geometry().margin, 3);
}

} // namespace toastkit
