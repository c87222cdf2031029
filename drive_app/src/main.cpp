// drive_app/main.cpp
#include "drive_app.h"
#include "layers/garage_layer.h"
#include <spdlog/spdlog.h>


int main()
{
    try {
        Drive::AppSpecification appSpec;
        appSpec.name = "Arcade Drive";
        Drive::DriveApp app(appSpec);

        app.pushLayer<GarageLayer>("garage");
        app.initialize();
        app.runApp();
    }
    catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
