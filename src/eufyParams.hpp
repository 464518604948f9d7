/*
 *	Client interface for Eufy Security device access
 *
 *	Device parameter catalog. Parameters travel as strings in the device
 *	records; every known parameter type carries a converter between that raw
 *	string and a typed Json::Value:
 *	 - JSON         raw string holds a JSON document (usually a number)
 *	 - BOOL         "0" or "1"
 *	 - BASE64_JSON  base64 wrapped JSON document
 *	 - STRING       kept as is
 *
 *	The eufyParams object is a read view over the "params" list of a device
 *	record. Parameter codes that are not in the catalog remain available as
 *	raw strings.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyParams
#define _eufyParams

#include <json/json.h>
#include <string>
#include <map>


namespace Eufy {
  namespace Param {
    enum value {
      // com.oceanwing.battery.cam.binder.model.CameraParams
      CHIME_STATE = 2015,
      DETECT_EXPOSURE = 2023,
      DETECT_MODE = 2004,
      DETECT_MOTION_SENSITIVE = 2005,
      DETECT_SCENARIO = 2028,
      DETECT_SWITCH = 2027,
      DETECT_ZONE = 2006,
      DOORBELL_AUDIO_RECODE = 2042,
      DOORBELL_BRIGHTNESS = 2032,
      DOORBELL_DISTORTION = 2033,
      DOORBELL_HDR = 2029,
      DOORBELL_IR_MODE = 2030,
      DOORBELL_LED_NIGHT_MODE = 2039,
      DOORBELL_MOTION_ADVANCE_OPTION = 2041,
      DOORBELL_MOTION_NOTIFICATION = 2035,
      DOORBELL_NOTIFICATION_JUMP_MODE = 2038,
      DOORBELL_NOTIFICATION_OPEN = 2036,
      DOORBELL_RECORD_QUALITY = 2034,
      DOORBELL_RING_RECORD = 2040,
      DOORBELL_SNOOZE_START_TIME = 2037,
      DOORBELL_VIDEO_QUALITY = 2031,
      NIGHT_VISUAL = 2002,
      OPEN_DEVICE = 2001,
      RINGING_VOLUME = 2022,
      SDCARD = 2010,
      UN_DETECT_ZONE = 2007,
      VOLUME = 2003,

      SNOOZE_MODE = 1271,
      WATERMARK_MODE = 1214,  // 1 - hide, 2 - show
      DEVICE_UPGRADE_NOW = 1134,
      CAMERA_UPGRADE_NOW = 1133,
      SCHEDULE_MODE = 1257,
      GUARD_MODE = 1224,  // see Eufy::GuardMode
      DEVICE_STATUS = 1131,
      BATTERY = 1101,
      CHARGING_STATUS = 2111,
      SENSOR_OPEN = 1550,

      FLOODLIGHT_MANUAL_SWITCH = 1400,
      FLOODLIGHT_MANUAL_BRIGHTNESS = 1401,  // 22-100
      FLOODLIGHT_MOTION_BRIGHTNESS = 1412,  // 22-100
      FLOODLIGHT_SCHEDULE_BRIGHTNESS = 1413,  // 22-100
      FLOODLIGHT_MOTION_SENSITIVTY = 1272,  // 1-5

      CAMERA_SPEAKER_VOLUME = 1230,
      CAMERA_RECORD_ENABLE_AUDIO = 1366,
      CAMERA_RECORD_RETRIGGER_INTERVAL = 1250,  // seconds
      CAMERA_RECORD_CLIP_LENGTH = 1249,  // seconds

      CAMERA_IR_CUT = 1013,
      CAMERA_PIR = 1011,
      CAMERA_WIFI_RSSI = 1142,

      CAMERA_MOTION_ZONES = 1204,
      CAMERA_OFF = 99904,
      IS_HOMEKIT_SECURE_VIDEO = 1285,
      CAMERA_NOTIFICATION_OPTIONS = 1710,
      RTSP_AUTHENTICATION = 1287,
      DEVICE_LIST_1 = 1158,
      DEVICE_LIST_2 = 1157,

      SENSOR_OPEN_STATUS_ALERT = 1290,
      SENSOR_DAILY_STATUS_CHECK = 1291,

      PUSH_MSG_MODE = 1252
    }; // enum value

    enum format {
      JSON,
      BOOL,
      BASE64_JSON,
      STRING
    }; // enum format
  }; // namespace Param
}; // namespace Eufy


class eufyParams
{

public:
	eufyParams() {}
	explicit eufyParams(const Json::Value &params);

	// catalog
	static bool lookup(const int code, Eufy::Param::value &param);
	static bool lookup(const std::string &name, Eufy::Param::value &param);
	static const char *getName(const Eufy::Param::value param);
	static Eufy::Param::format getFormat(const Eufy::Param::value param);
	static Json::Value load(const Eufy::Param::value param, const std::string &raw);
	static std::string dump(const Eufy::Param::value param, const Json::Value &value);

	// record view
	bool has(const Eufy::Param::value param) const;
	Json::Value get(const Eufy::Param::value param) const;
	bool getRaw(const int code, std::string &raw) const;
	size_t size() const { return m_raw.size(); }

private:
	std::map<int, std::string> m_raw;
};

#endif // _eufyParams
