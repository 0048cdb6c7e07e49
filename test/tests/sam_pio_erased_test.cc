#include <vector>

#include "utils/sam_pio_test_helper.hxx"

using namespace sampio;

DECLARE_FAKE_PIO_PORT(ErasePort, 'A');
DECLARE_FAKE_PIO_PORT(ArrayPort, 'B');
DECLARE_FAKE_PIO_PORT(DeathPort, 'C');

TEST(SamPioErasedTest, SameBitsAsTypedPin)
{
    auto parts = split_fake_port<ErasePort>();
    auto out = std::move(parts.pin<13>()).into_output(parts.oer);
    PioRegisterDump before = dump_registers<ErasePort>();

    out.set();
    uint32_t typed_sodr = PIO_REG(ErasePort, PIO_SODR);
    out.clr();
    uint32_t typed_codr = PIO_REG(ErasePort, PIO_CODR);

    auto erased = std::move(out).erase();
    static_assert(std::is_same<decltype(erased),
                      PioErasedPin<ErasePort, Output<PushPull>>>::value,
        "");
    EXPECT_FALSE(out.is_owned());
    EXPECT_TRUE(erased.is_owned());
    EXPECT_EQ(13u, erased.pin_num());
    EXPECT_EQ(1u << 13, erased.pin_mask());

    ErasePort::regs()->PIO_SODR = 0;
    ErasePort::regs()->PIO_CODR = 0;
    erased.set();
    EXPECT_EQ(typed_sodr, PIO_REG(ErasePort, PIO_SODR));
    EXPECT_EQ(0u, PIO_REG(ErasePort, PIO_CODR));
    erased.clr();
    EXPECT_EQ(typed_codr, PIO_REG(ErasePort, PIO_CODR));

    // Erasing itself does not touch the hardware.
    PioRegisterDump after = dump_registers<ErasePort>();
    after[PIO_DUMP_INDEX(PIO_SODR)] = before[PIO_DUMP_INDEX(PIO_SODR)];
    after[PIO_DUMP_INDEX(PIO_CODR)] = before[PIO_DUMP_INDEX(PIO_CODR)];
    EXPECT_EQ(before, after);
}

TEST(SamPioErasedTest, Array)
{
    typedef PioErasedPin<ArrayPort, Output<>> LedPin;
    auto parts = split_fake_port<ArrayPort>();
    std::vector<LedPin> leds;
    leds.push_back(std::move(parts.pin<0>()).into_output(parts.oer).erase());
    leds.push_back(std::move(parts.pin<5>()).into_output(parts.oer).erase());
    leds.push_back(std::move(parts.pin<17>()).into_output(parts.oer).erase());
    leds.push_back(std::move(parts.pin<31>()).into_output(parts.oer).erase());

    const unsigned expected_pins[] = {0, 5, 17, 31};
    ASSERT_EQ(4u, leds.size());
    for (unsigned i = 0; i < leds.size(); ++i)
    {
        EXPECT_TRUE(leds[i].is_owned());
        EXPECT_EQ(expected_pins[i], leds[i].pin_num());
        leds[i].write(true);
        EXPECT_EQ(1u << expected_pins[i], PIO_REG(ArrayPort, PIO_SODR));
        leds[i].write(false);
        EXPECT_EQ(1u << expected_pins[i], PIO_REG(ArrayPort, PIO_CODR));
    }
}

TEST(SamPioErasedTest, MovedFromDies)
{
    auto parts = split_fake_port<DeathPort>();
    auto out = std::move(parts.pin<6>()).into_output(parts.oer);
    auto erased = std::move(out).erase();
    EXPECT_DEATH(std::move(out).erase(), "owned_");
    EXPECT_DEATH(out.set(), "owned_");

    auto moved = std::move(erased);
    EXPECT_DEATH(erased.set(), "owned_");
    EXPECT_DEATH(erased.clr(), "owned_");
    moved.clr();
    EXPECT_EQ(0x40u, PIO_REG(DeathPort, PIO_CODR));
}
