/* PURPOSE:
 * Process bootstrap: options and config, simulated hardware, controller thread,
 * UDP endpoint and (unless headless) the operator panel.
*/

#pragma once

class App {
public:
    static int run(int argc, char** argv);
};
