#include <pylon/config.hpp>

#include <cstdlib>

namespace pylon
{

namespace
{
void override_from_env(std::string& field, const char* name)
{
    const char* value = std::getenv(name);
    if (value && *value != '\0')
        field = value;
}
}  // namespace

app_config app_config::from_env()
{
    app_config config;
    override_from_env(config.application_id, "PYLON_APP_ID");
    override_from_env(config.rendezvous_url, "PYLON_RENDEZVOUS_URL");
    override_from_env(config.relay_url, "PYLON_RELAY_URL");
    return config;
}

}  // namespace pylon
