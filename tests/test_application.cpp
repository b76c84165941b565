#include <gtest/gtest.h>
#include "app/Application.hpp"

namespace {

class Banner : public Model {
public:
    std::string view() const override { return state().value("title", std::string()); }
    UpdateResult update(const Message&) const override { return unchanged(); }
};

class LoudBanner : public Banner {
public:
    std::string view() const override { return Banner::view() + "!"; }
};

}

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.define<Banner>("Banner");
        config.root = "Banner";
        config.rootState = {{"title", "hi"}};
    }

    ComponentRegistry registry;
    AppConfig config;
};

TEST_F(ApplicationTest, RootModelFromConfig) {
    Application app(config, registry);
    auto root = app.rootModel();
    EXPECT_EQ(root->typeName(), "Banner");
    EXPECT_EQ(root->view(), "hi");
}

TEST_F(ApplicationTest, MissingRootThrows) {
    config.root.clear();
    Application app(config, registry);
    EXPECT_THROW(app.rootModel(), ConfigError);
}

TEST_F(ApplicationTest, UnknownRootThrows) {
    config.root = "Nope";
    Application app(config, registry);
    EXPECT_THROW(app.rootModel(), ComponentNotFoundError);
}

TEST_F(ApplicationTest, RedefineRefusedOutsideDevelopment) {
    Application app(config, registry);
    auto root = app.rootModel();

    EXPECT_FALSE(app.redefine<LoudBanner>("Banner"));
    EXPECT_EQ(app.runtime().pending(), 0u);
    EXPECT_EQ(root->with()->view(), "hi");
}

TEST_F(ApplicationTest, RedefineSwapsTypeAndQueuesReload) {
    config.env = "development";
    Application app(config, registry);
    auto root = app.rootModel();

    EXPECT_TRUE(app.redefine<LoudBanner>("Banner"));
    EXPECT_EQ(app.runtime().pending(), 1u);
    EXPECT_EQ(registry.get("Banner")->revision(), 2);

    // Banner ignores Reload, so the next frame comes from with()
    auto next = app.runtime().tick(root);
    EXPECT_TRUE(app.runtime().render());
    EXPECT_EQ(next->with()->view(), "hi!");
}

TEST_F(ApplicationTest, ExplicitHotReloadingWins) {
    config.hotReloading = true;
    Application app(config, registry);
    EXPECT_TRUE(app.redefine<LoudBanner>("Banner"));
}
