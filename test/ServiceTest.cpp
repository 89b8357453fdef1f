#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "Accessory.h"
#include "HapError.h"
#include "ModelTest.h"

using namespace hapdb;

class ServiceTest : public ModelTest {
protected:
    void SetUp() override {
        ModelTest::SetUp();
        accessory = std::make_unique<Accessory>();
    }

    std::unique_ptr<Accessory> accessory;
};

TEST_F(ServiceTest, ServicesAndCharacteristicsShareTheAccessoryCounter) {
    Service& light = accessory->addService("lightbulb");
    Characteristic& on = light.addCharacteristic("on");
    Service& fan = accessory->addService("fan");
    Characteristic& fanOn = fan.addCharacteristic("on");

    EXPECT_EQ(light.getIid(), 1u);
    EXPECT_EQ(on.getIid(), 2u);
    EXPECT_EQ(fan.getIid(), 3u);
    EXPECT_EQ(fanOn.getIid(), 4u);
}

TEST_F(ServiceTest, DuplicateCharacteristicTypeIsRejected) {
    Service& light = accessory->addService("lightbulb");
    light.addCharacteristic("on", []() {
        CharacteristicOptions options;
        options.value = CharacteristicValue(true);
        return options;
    }());

    uint64_t before = accessory->getLastId();
    EXPECT_THROW(light.addCharacteristic("public.hap.characteristic.on"), DuplicateCharacteristicError);

    // Never overwritten and no iid spent
    EXPECT_EQ(light.getCharacteristics().size(), 1u);
    EXPECT_TRUE(std::get<bool>(*light["on"].getValue()));
    EXPECT_EQ(accessory->getLastId(), before);
}

TEST_F(ServiceTest, UnknownCharacteristicTypeThrows) {
    Service& light = accessory->addService("lightbulb");
    EXPECT_THROW(light.addCharacteristic("toast-level"), UnknownTypeError);
}

TEST_F(ServiceTest, LookupByType) {
    Service& light = accessory->addService("lightbulb");
    Characteristic& on = light.addCharacteristic("on");

    EXPECT_TRUE(light.has("on"));
    EXPECT_TRUE(light.has("25"));
    EXPECT_FALSE(light.has("brightness"));
    EXPECT_EQ(light.findCharacteristic("on"), &on);
    EXPECT_EQ(light.findCharacteristic("brightness"), nullptr);
    EXPECT_EQ(&light.getCharacteristic("public.hap.characteristic.on"), &on);
    EXPECT_THROW(light.getCharacteristic("brightness"), NotFoundError);
    EXPECT_THROW(light["brightness"], NotFoundError);
    EXPECT_EQ(light.characteristicByIid(on.getIid()), &on);
    EXPECT_EQ(light.characteristicByIid(999), nullptr);
}

TEST_F(ServiceTest, ValueWithFallback) {
    Service& light = accessory->addService("lightbulb");
    light.addCharacteristic("on");

    CharacteristicValue fallback(int64_t(-1));
    EXPECT_EQ(std::get<int64_t>(light.value("on", fallback)), -1);
    EXPECT_EQ(std::get<int64_t>(light.value("brightness", fallback)), -1);

    light["on"].setValue(CharacteristicValue(false));
    EXPECT_FALSE(std::get<bool>(light.value("on", fallback)));
}

TEST_F(ServiceTest, AddRequiredCreatesRegistryCharacteristics) {
    Service& outlet = accessory->addService("outlet", std::nullopt, true);

    ASSERT_EQ(outlet.getCharacteristics().size(), 2u);
    EXPECT_TRUE(outlet.has("on"));
    EXPECT_TRUE(outlet.has("outlet-in-use"));
    EXPECT_EQ(outlet["outlet-in-use"].getFormat(), CharacteristicFormat::BOOL);
}

TEST_F(ServiceTest, WithoutAddRequiredServiceStartsEmpty) {
    Service& outlet = accessory->addService("outlet");
    EXPECT_TRUE(outlet.getCharacteristics().empty());
}

TEST_F(ServiceTest, NameIsStoredAndWrittenToNameCharacteristic) {
    Service& light = accessory->addService("lightbulb", std::string("Desk Lamp"));

    ASSERT_TRUE(light.getName().has_value());
    EXPECT_EQ(*light.getName(), "Desk Lamp");
    EXPECT_EQ(std::get<std::string>(*light["name"].getValue()), "Desk Lamp");
}

TEST_F(ServiceTest, NameReusesRequiredNameCharacteristic) {
    Service& info = accessory->addService("accessory-information", std::string("Bridge"), true);

    EXPECT_EQ(info.getCharacteristics().size(), 6u);
    EXPECT_EQ(std::get<std::string>(*info["name"].getValue()), "Bridge");
}

TEST_F(ServiceTest, EveryIidUniqueWithinAccessory) {
    Service& info = accessory->addService("accessory-information", std::string("Hub"), true);
    Service& thermostat = accessory->addService("thermostat", std::string("Hall"), true);
    Service& battery = accessory->addService("battery", std::nullopt, true);

    std::set<uint64_t> iids;
    size_t count = 0;
    for (const Service* service : { &info, &thermostat, &battery }) {
        iids.insert(service->getIid());
        ++count;
        for (const auto& characteristic : service->getCharacteristics()) {
            iids.insert(characteristic->getIid());
            ++count;
        }
    }
    EXPECT_EQ(iids.size(), count);
}

TEST_F(ServiceTest, LinksAreDirectedAndDeduplicated) {
    Service& outlet = accessory->addService("outlet");
    Service& label = accessory->addService("service-label");

    outlet.addLinkedService(label);
    outlet.addLinkedService(label);

    EXPECT_EQ(outlet.getLinkedIids(), std::vector<uint64_t>{ label.getIid() });
    EXPECT_TRUE(outlet.isLinkedTo(label));
    EXPECT_FALSE(label.isLinkedTo(outlet));
}

TEST_F(ServiceTest, LinkingAcrossAccessoriesIsRejected) {
    Accessory other;
    Service& local = accessory->addService("switch");
    Service& remote = other.addService("switch");

    EXPECT_THROW(local.addLinkedService(remote), std::invalid_argument);
    EXPECT_FALSE(local.isLinkedTo(remote));
}

TEST_F(ServiceTest, ToJsonOmitsEmptyLinkedList) {
    Service& light = accessory->addService("lightbulb");
    light.addCharacteristic("on");

    Json record = light.toJson();
    EXPECT_EQ(record["iid"].get<uint64_t>(), light.getIid());
    EXPECT_EQ(record["type"].get<std::string>(), "00000043-0000-1000-8000-0026BB765291");
    EXPECT_EQ(record["characteristics"].size(), 1u);
    EXPECT_FALSE(record.contains("linked"));

    Service& fan = accessory->addService("fan");
    light.addLinkedService(fan);
    EXPECT_EQ(light.toJson()["linked"], Json::array({ fan.getIid() }));
}
