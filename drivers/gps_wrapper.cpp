/*
 * GPS Wrapper Implementation
 */

#include "drivers/gps_wrapper.hpp"

#include "hardware/gpio.h"
#include "hardware/uart.h"

#include <cstdio>

static uart_inst_t *gps_uart() {
    return GPS_UART_NUM == 0U ? uart0 : uart1;
}

bool GPS_Wrapper::init() {
    if (initialized_) {
        return true;
    }

    uint actual = uart_init(gps_uart(), GPS_BAUD_RATE);
    gpio_set_function(GPS_TX_PIN, GPIO_FUNC_UART);
    gpio_set_function(GPS_RX_PIN, GPIO_FUNC_UART);
    uart_set_format(gps_uart(), 8, 1, UART_PARITY_NONE);
    uart_set_fifo_enabled(gps_uart(), true);

    printf("[GPS] UART%u at %u baud\n", static_cast<unsigned>(GPS_UART_NUM), actual);
    initialized_ = true;
    return true;
}

uint32_t GPS_Wrapper::poll() {
    if (!initialized_) {
        return 0;
    }

    uint32_t count = 0;
    while (count < MAX_BYTES_PER_POLL && uart_is_readable(gps_uart())) {
        parser_.feed(static_cast<char>(uart_getc(gps_uart())));
        count++;
    }

    if (count > 0 && bytes_total_ == 0) {
        printf("[GPS] Receiver talking\n");
    }
    bytes_total_ = (UINT32_MAX - bytes_total_ < count) ? UINT32_MAX : bytes_total_ + count;
    return count;
}
