#include <memory>

#include "freertos_drivers/common/GpioWrapper.hxx"
#include "utils/sam_pio_test_helper.hxx"

using namespace sampio;

DECLARE_FAKE_PIO_PORT(WrapPort, 'A');

/// Stand-in for a library that only knows about the runtime interface.
static void blink(Gpio *gpio)
{
    gpio->set();
    gpio->clr();
}

class GpioWrapperTest : public ::testing::Test
{
protected:
    static void SetUpTestCase()
    {
        parts_.reset(new PioParts<WrapPort>(split_fake_port<WrapPort>()));
    }

    static void TearDownTestCase()
    {
        parts_.reset();
    }

    void clear_output_registers()
    {
        WrapPort::regs()->PIO_SODR = 0;
        WrapPort::regs()->PIO_CODR = 0;
    }

    static std::unique_ptr<PioParts<WrapPort>> parts_;
};

std::unique_ptr<PioParts<WrapPort>> GpioWrapperTest::parts_;

TEST_F(GpioWrapperTest, TypedPin)
{
    auto led = std::move(parts_->pin<3>()).into_output(parts_->oer);
    GpioWrapper<decltype(led)> gpio(std::move(led));
    EXPECT_FALSE(led.is_owned());
    EXPECT_TRUE(gpio.pin()->is_owned());

    clear_output_registers();
    gpio.write(Gpio::SET);
    EXPECT_EQ(0x8u, PIO_REG(WrapPort, PIO_SODR));
    EXPECT_EQ(0u, PIO_REG(WrapPort, PIO_CODR));
    gpio.write(Gpio::CLR);
    EXPECT_EQ(0x8u, PIO_REG(WrapPort, PIO_CODR));

    clear_output_registers();
    blink(&gpio);
    EXPECT_EQ(0x8u, PIO_REG(WrapPort, PIO_SODR));
    EXPECT_EQ(0x8u, PIO_REG(WrapPort, PIO_CODR));
}

TEST_F(GpioWrapperTest, ErasedPin)
{
    auto led =
        std::move(parts_->pin<21>()).into_output(parts_->oer).erase();
    GpioWrapper<PioErasedPin<WrapPort, Output<>>> gpio(std::move(led));
    EXPECT_EQ(21u, gpio.pin()->pin_num());

    clear_output_registers();
    Gpio *g = &gpio;
    g->set();
    EXPECT_EQ(1u << 21, PIO_REG(WrapPort, PIO_SODR));
    g->write(Gpio::CLR);
    EXPECT_EQ(1u << 21, PIO_REG(WrapPort, PIO_CODR));
}

TEST_F(GpioWrapperTest, MovedHandleDies)
{
    auto led = std::move(parts_->pin<30>()).into_output(parts_->oer);
    auto other = std::move(led);
    GpioWrapper<decltype(led)> gpio(std::move(led));
    EXPECT_DEATH(gpio.set(), "owned_");
}
